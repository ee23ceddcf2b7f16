#include <cmath>
#include <sstream>
#include <vector>
#include "color.hpp"
#include "color_error.hpp"
#include "CppUTest/TestHarness.h"

TEST_GROUP(ColorTests)
{
    static void checkBytes( const Color& color, int r, int g, int b, int a)
    {
        LONGS_EQUAL( r, color.red());
        LONGS_EQUAL( g, color.green());
        LONGS_EQUAL( b, color.blue());
        LONGS_EQUAL( a, color.alpha());
    }
};

TEST( ColorTests, DefaultIsOpaqueBlack)
{
    checkBytes( Color(), 0, 0, 0, 255);
}

TEST( ColorTests, ParsesHex)
{
    auto color = Color( "#ff8040");
    checkBytes( color, 255, 128, 64, 255);
    DOUBLES_EQUAL( 20.1, color.hue(), .05);
    DOUBLES_EQUAL( 1., color.saturation(), 1e-12);
    DOUBLES_EQUAL( .625, color.lightness(), 1e-3);

    checkBytes( Color( "0A08"), 0, 170, 0, 136);
}

TEST( ColorTests, ParsesKeywords)
{
    checkBytes( Color( "Orange"), 255, 165, 0, 255);
    checkBytes( Color( "transparent"), 0, 0, 0, 0);
    // Short hex digits win over keywords.
    checkBytes( Color( "bad"), 0xbb, 0xaa, 0xdd, 255);
}

TEST( ColorTests, RejectsUnknownStrings)
{
    CHECK_THROWS( InvalidColorString, Color( "notacolor"));
    CHECK_THROWS( InvalidColorString, Color( ""));
    CHECK_THROWS( InvalidColorString, Color( "#12345"));
    CHECK_THROWS( InvalidName, Color::fromName( "#fff"));
    CHECK_THROWS( InvalidHex, Color::fromHex( "red"));
}

TEST( ColorTests, FromRgbaAcceptsBytesAndFractions)
{
    checkBytes( Color::fromRgba( 255, 128, 64), 255, 128, 64, 255);
    checkBytes( Color::fromRgba( 1., .5, 0., .5), 255, 128, 0, 128);
    checkBytes( Color::fromRgba( 10, .5, 20, 1.), 10, 128, 20, 255);
    CHECK_THROWS( InvalidComponent, Color::fromRgba( 256, 0, 0));
    CHECK_THROWS( InvalidComponent, Color::fromRgba( 0, 0, 0, 1.2));
}

TEST( ColorTests, FromHsla)
{
    checkBytes( Color::fromHsla( 120, 1, .5), 0, 255, 0, 255);
    checkBytes( Color::fromHsla( 0, 0, 1, .5), 255, 255, 255, 128);
    CHECK_THROWS( InvalidComponent, Color::fromHsla( 0, 2, .5));
}

TEST( ColorTests, WithChannelReturnsEqualColor)
{
    auto color = Color( "#336699cc");
    CHECK( color.withRed( color.red()) == color);
    CHECK( color.withAlpha( color.alpha()) == color);
    checkBytes( color.withGreen( 0), 0x33, 0, 0x99, 0xcc);
    checkBytes( color.withBlue( 1.), 0x33, 0x66, 255, 0xcc);
    checkBytes( color.withAlpha( 0.), 0x33, 0x66, 0x99, 0);
    // The source is never modified.
    checkBytes( color, 0x33, 0x66, 0x99, 0xcc);
}

TEST( ColorTests, WithHslComponents)
{
    auto red = Color( "red");
    CHECK( red.withHue( 120) == Color( "lime"));
    CHECK( red.withSaturation( 0) == Color( "#808080"));
    CHECK( red.withLightness( 1) == Color( "white"));
    LONGS_EQUAL( 0x80, Color( "#ff000080").withHue( 240).alpha());
}

TEST( ColorTests, WithRejectsWhatFactoriesReject)
{
    auto color = Color( "#336699cc");
    CHECK_THROWS( InvalidComponent, color.withRed( 256));
    CHECK_THROWS( InvalidComponent, color.withGreen( -1));
    CHECK_THROWS( InvalidComponent, color.withBlue( 1.5));
    CHECK_THROWS( InvalidComponent, color.withAlpha( std::nan( "")));
    CHECK_THROWS( InvalidComponent, color.withSaturation( 1.5));
    CHECK_THROWS( InvalidComponent, color.withLightness( -.1));
    CHECK_THROWS( InvalidComponent, color.withHue( std::nan( "")));
    CHECK_THROWS( InvalidComponent, color.withHue( INFINITY));

    checkBytes( color, 0x33, 0x66, 0x99, 0xcc);
    CHECK( color == Color( "#336699cc"));
}

TEST( ColorTests, HueWrapsAroundTheCircle)
{
    CHECK( Color::fromHsla( 480, 1, .5) == Color::fromHsla( 120, 1, .5));
    CHECK( Color::fromHsla( -240, 1, .5) == Color::fromHsla( 120, 1, .5));
    CHECK( Color( "red").withHue( 360) == Color( "red"));
    CHECK( Color( "red").withHue( 600) == Color( "blue"));
}

TEST( ColorTests, Complement)
{
    CHECK( Color( "red").complement() == Color( "cyan"));
    CHECK( Color( "blue").complement() == Color( "yellow"));
}

TEST( ColorTests, InvertAndGrayscale)
{
    checkBytes( Color( "#ff804010").invert(), 0, 127, 191, 0x10);
    auto gray = Color( "#ff8040").grayscale();
    CHECK( gray.red() == gray.green() && gray.green() == gray.blue());
    DOUBLES_EQUAL( 0., gray.saturation(), 1e-12);
}

TEST( ColorTests, LightenAndDarken)
{
    CHECK( Color( "red").lighten( .5) == Color( "white"));
    CHECK( Color( "red").darken( .5) == Color( "black"));
    CHECK( Color( "red").lighten( .9) == Color( "white"));
    CHECK( Color( "red").lighten( 0) == Color( "red"));
    CHECK_THROWS( InvalidComponent, Color( "red").darken( -.1));
    CHECK_THROWS( InvalidComponent, Color( "red").lighten( 1.1));
}

TEST( ColorTests, MixEndpoints)
{
    auto a = Color( "#102030"), b = Color( "#f0e0d080");
    CHECK( a.mix( b, 0) == a);
    CHECK( a.mix( b, 1) == b);
    checkBytes( Color( "black").mix( Color( "white")), 128, 128, 128, 255);
    CHECK_THROWS( InvalidComponent, a.mix( b, 1.5));
}

TEST( ColorTests, Average)
{
    auto mean = Color::average( Color( "red"), Color( "blue"));
    checkBytes( mean, 128, 0, 128, 255);
    checkBytes( Color::average( std::vector<Color>{ Color( "#010203")}), 1, 2, 3, 255);
    CHECK_THROWS( EmptyInput, Color::average());
    CHECK_THROWS( EmptyInput, Color::average( std::vector<Color>{}));
}

TEST( ColorTests, Luminance)
{
    DOUBLES_EQUAL( 0., Color( "black").relativeLuminance(), 1e-12);
    DOUBLES_EQUAL( 1., Color( "white").relativeLuminance(), 1e-12);
    DOUBLES_EQUAL( 1., Color( "white").perceivedLightness(), 1e-9);
    DOUBLES_EQUAL( 0., Color( "black").perceivedLightness(), 1e-12);
}

TEST( ColorTests, ContrastRatio)
{
    auto black = Color( "black"), white = Color( "white"), teal = Color( "teal");
    DOUBLES_EQUAL( 21., black.contrastRatio( white), 1e-9);
    DOUBLES_EQUAL( 21., white.contrastRatio( black), 1e-9);
    DOUBLES_EQUAL( 1., teal.contrastRatio( teal), 1e-12);
    CHECK( black.meetsContrast( white, Accessibility::Level::AAA));
    CHECK_FALSE( teal.meetsContrast( teal, Accessibility::Level::AA, true));
}

TEST( ColorTests, BestTextColor)
{
    CHECK( Color( "#336699").bestTextColor() == Color( "white"));
    CHECK( Color( "yellow").bestTextColor() == Color( "black"));
    CHECK( Color( "#336699").bestTextColor( std::string( "ivory"), Color( "#111111")) == Color( "ivory"));
    CHECK_THROWS( InvalidName, Color( "red").bestTextColor( std::string( "#fff"), std::string( "black")));
}

TEST( ColorTests, BestTextColorTieFavorsDark)
{
    auto gray = Color( "gray");
    CHECK( gray.bestTextColor( gray, Color( "#808080")) == Color( "#808080"));
    CHECK( gray.bestTextColor( Color( "#808080ff"), Color( "#80808000")) == Color( "#80808000"));
}

TEST( ColorTests, ClosestName)
{
    STRCMP_EQUAL( "tomato", std::string( Color( "#fe6347").closestName()).c_str());
}

TEST( ColorTests, StringOutput)
{
    auto color = Color( "#FF8040");
    STRCMP_EQUAL( "#ff8040ff", color.toHex().c_str());
    STRCMP_EQUAL( "FF8040", color.toHex( false, false, true).c_str());
    STRCMP_EQUAL( "rgb(255 128 64 / 1)", color.toRgbString().c_str());
    STRCMP_EQUAL( "hsl(0deg 100% 50% / 1)", Color( "red").toHslString().c_str());
    STRCMP_EQUAL( "#ff8040ff", static_cast<std::string>( color).c_str());

    std::ostringstream stream;
    stream << color;
    STRCMP_EQUAL( "#ff8040ff", stream.str().c_str());
}

TEST( ColorTests, ArrayOutput)
{
    auto color = Color( "#ff000080");
    auto rgba = color.toRgbaArray();
    LONGS_EQUAL( 255, rgba[ 0]);
    LONGS_EQUAL( 128, rgba[ 3]);

    auto hsla = color.toHslArray();
    DOUBLES_EQUAL( 0., hsla[ 0], 1e-12);
    DOUBLES_EQUAL( 1., hsla[ 1], 1e-12);
    DOUBLES_EQUAL( .5, hsla[ 2], 1e-12);
    DOUBLES_EQUAL( 128. / 255, hsla[ 3], 1e-12);

    auto all = color.toArray();
    DOUBLES_EQUAL( 255., all[ 0], 1e-12);
    DOUBLES_EQUAL( 128., all[ 3], 1e-12);
    DOUBLES_EQUAL( .5, all[ 6], 1e-12);
}

TEST( ColorTests, EqualityComparesBytesOnly)
{
    auto a = Color( "#336699");
    (void)a.hue();
    auto b = Color( "#336699ff");
    CHECK( a == b);
    CHECK( a.equal( b));
    CHECK( a != Color( "#33669900"));
}

TEST( ColorTests, CopiesAreIndependent)
{
    auto source = Color( "#ff8040");
    DOUBLES_EQUAL( 1., source.saturation(), 1e-12);
    auto copy = source;
    copy = Color( "gray");
    DOUBLES_EQUAL( 0., copy.saturation(), 1e-12);
    DOUBLES_EQUAL( 1., source.saturation(), 1e-12);
}
