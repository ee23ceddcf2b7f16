#include <cmath>
#include <ostream>
#include "chromatic.hpp"
#include "color.hpp"
#include "color_error.hpp"
#include "codecs/color_space_converter.hpp"
#include "codecs/hex_codec.hpp"
#include "utils/color_utils.hpp"
#include "utils/utils.hpp"

namespace
{
    Color resolve( const ColorReference& reference)
    {
        if( auto *name = std::get_if<std::string>( &reference))
            return Color::fromName( *name);
        return std::get<Color>( reference);
    }

    uint8_t lerp( uint8_t from, uint8_t to, double fraction)
    {
        return static_cast<uint8_t>( std::round( from * ( 1. - fraction) + to * fraction));
    }
}

Color::DerivedCache& Color::DerivedCache::operator=( const DerivedCache&) noexcept
{
    hsl_ready.store( false);
    luminance_ready.store( false);
    perceived_ready.store( false);
    return *this;
}

Color::Color() noexcept = default;

Color::Color( const Rgba& rgba) noexcept
: rgba( rgba)
{
}

Color::Color( std::string_view color)
{
    if( HexCodec::valid( color))
        rgba = HexCodec::toBytes( color);
    else if( ColorUtil::validName( color))
        rgba = ColorUtil::nameToBytes( color);
    else
        throw InvalidColorString( color);
}

Color Color::fromRgba( Component red, Component green, Component blue, Component alpha)
{
    return Color( Rgba{ red.toByte( "red"), green.toByte( "green"), blue.toByte( "blue"), alpha.toByte( "alpha")});
}

Color Color::fromHsla( double hue, double saturation, double lightness, Component alpha)
{
    auto a   = alpha.toByte( "alpha");
    auto rgb = ColorSpaceConverter::hslToRgb( hue, saturation, lightness);
    return Color( Rgba{ rgb[ 0], rgb[ 1], rgb[ 2], a});
}

Color Color::fromHex( std::string_view hex)
{
    return Color( HexCodec::toBytes( hex));
}

Color Color::fromName( std::string_view name)
{
    return Color( ColorUtil::nameToBytes( name));
}

Color Color::average( const std::vector<Color>& colors)
{
    if( colors.empty())
        throw EmptyInput( "average");

    std::array<uint64_t, 4> sums{};
    for( auto& color : colors)
    {
        for( size_t i = 0; i < sums.size(); ++i)
            sums[ i] += color.rgba[ i];
    }

    Rgba mean;
    for( size_t i = 0; i < sums.size(); ++i)
        mean[ i] = static_cast<uint8_t>( std::round( DOUBLE_CAST( sums[ i]) / colors.size()));

    return Color( mean);
}

HslColor Color::hsl() const
{
    if( cache.hsl_ready.load( std::memory_order_acquire))
        return { cache.hue.load( std::memory_order_relaxed),
                 cache.saturation.load( std::memory_order_relaxed),
                 cache.lightness.load( std::memory_order_relaxed)};

    auto hsl = ColorSpaceConverter::rgbToHsl( red(), green(), blue());
    cache.hue.store( hsl.hue, std::memory_order_relaxed);
    cache.saturation.store( hsl.saturation, std::memory_order_relaxed);
    cache.lightness.store( hsl.lightness, std::memory_order_relaxed);
    cache.hsl_ready.store( true, std::memory_order_release);
    return hsl;
}

double Color::hue() const
{
    return hsl().hue;
}

double Color::saturation() const
{
    return hsl().saturation;
}

double Color::lightness() const
{
    return hsl().lightness;
}

double Color::relativeLuminance() const
{
    if( cache.luminance_ready.load( std::memory_order_acquire))
        return cache.luminance.load( std::memory_order_relaxed);

    auto luminance = Accessibility::relativeLuminance( red(), green(), blue());
    cache.luminance.store( luminance, std::memory_order_relaxed);
    cache.luminance_ready.store( true, std::memory_order_release);
    return luminance;
}

double Color::perceivedLightness() const
{
    if( cache.perceived_ready.load( std::memory_order_acquire))
        return cache.perceived.load( std::memory_order_relaxed);

    auto perceived = Accessibility::perceivedLightness( relativeLuminance());
    cache.perceived.store( perceived, std::memory_order_relaxed);
    cache.perceived_ready.store( true, std::memory_order_release);
    return perceived;
}

Color Color::withRed( Component red) const
{
    auto changed = rgba;
    changed[ ENUM_CAST( Channel::Red)] = red.toByte( "red");
    return Color( changed);
}

Color Color::withGreen( Component green) const
{
    auto changed = rgba;
    changed[ ENUM_CAST( Channel::Green)] = green.toByte( "green");
    return Color( changed);
}

Color Color::withBlue( Component blue) const
{
    auto changed = rgba;
    changed[ ENUM_CAST( Channel::Blue)] = blue.toByte( "blue");
    return Color( changed);
}

Color Color::withAlpha( Component alpha) const
{
    auto changed = rgba;
    changed[ ENUM_CAST( Channel::Alpha)] = alpha.toByte( "alpha");
    return Color( changed);
}

Color Color::withHue( double hue) const
{
    auto current = hsl();
    return fromHsla( hue, current.saturation, current.lightness, alpha());
}

Color Color::withSaturation( double saturation) const
{
    auto current = hsl();
    return fromHsla( current.hue, saturation, current.lightness, alpha());
}

Color Color::withLightness( double lightness) const
{
    auto current = hsl();
    return fromHsla( current.hue, current.saturation, lightness, alpha());
}

Color Color::mix( const Color& other, double fraction) const
{
    if( !( fraction >= 0. && fraction <= 1.))
        throw InvalidComponent( "mix fraction", Util::formatNumber( fraction) + " is outside [0.0, 1.0]");

    Rgba mixed;
    for( size_t i = 0; i < mixed.size(); ++i)
        mixed[ i] = lerp( rgba[ i], other.rgba[ i], fraction);

    return Color( mixed);
}

Color Color::complement() const
{
    return withHue( hue() + DEG_MAX / 2);
}

Color Color::invert() const
{
    return Color( Rgba{ static_cast<uint8_t>( RGB_SCALE - red()),
                        static_cast<uint8_t>( RGB_SCALE - green()),
                        static_cast<uint8_t>( RGB_SCALE - blue()), alpha()});
}

Color Color::grayscale() const
{
    return withSaturation( 0.);
}

Color Color::lighten( double amount) const
{
    if( !( amount >= 0. && amount <= 1.))
        throw InvalidComponent( "lighten amount", Util::formatNumber( amount) + " is outside [0.0, 1.0]");
    return withLightness( Util::clamp( lightness() + amount, 0., 1.));
}

Color Color::darken( double amount) const
{
    if( !( amount >= 0. && amount <= 1.))
        throw InvalidComponent( "darken amount", Util::formatNumber( amount) + " is outside [0.0, 1.0]");
    return withLightness( Util::clamp( lightness() - amount, 0., 1.));
}

double Color::contrastRatio( const Color& other) const
{
    return Accessibility::contrastRatio( relativeLuminance(), other.relativeLuminance());
}

bool Color::meetsContrast( const Color& other, Accessibility::Level level, bool large_text) const
{
    return contrastRatio( other) >= Accessibility::minimumContrast( level, large_text);
}

Color Color::bestTextColor() const
{
    return bestTextColor( std::string( DEFAULT_LIGHT_TEXT), std::string( DEFAULT_DARK_TEXT));
}

Color Color::bestTextColor( const ColorReference& light, const ColorReference& dark) const
{
    auto light_color = resolve( light),
         dark_color  = resolve( dark);

    return contrastRatio( dark_color) >= contrastRatio( light_color) ? dark_color : light_color;
}

std::string_view Color::closestName() const
{
    return ColorUtil::closestName( rgba);
}

bool Color::equal( const Color& other) const noexcept
{
    return rgba == other.rgba;
}

std::string Color::toHex( bool include_alpha, bool include_hash, bool upper_case) const
{
    return HexCodec::fromBytes( rgba, include_alpha, include_hash, upper_case);
}

std::string Color::toRgbString() const
{
    return "rgb(" + std::to_string( red()) + " " + std::to_string( green()) + " " + std::to_string( blue())
           + " / " + Util::formatNumber( DOUBLE_CAST( alpha()) / RGB_SCALE) + ")";
}

std::string Color::toHslString() const
{
    auto current = hsl();
    return "hsl(" + Util::formatNumber( current.hue) + "deg "
           + Util::formatNumber( current.saturation * PERCENT) + "% "
           + Util::formatNumber( current.lightness * PERCENT) + "% / "
           + Util::formatNumber( DOUBLE_CAST( alpha()) / RGB_SCALE) + ")";
}

Rgba Color::toRgbaArray() const noexcept
{
    return rgba;
}

std::array<double, 4> Color::toHslArray() const
{
    auto current = hsl();
    return { current.hue, current.saturation, current.lightness, DOUBLE_CAST( alpha()) / RGB_SCALE};
}

std::array<double, 7> Color::toArray() const
{
    auto current = hsl();
    return { DOUBLE_CAST( red()), DOUBLE_CAST( green()), DOUBLE_CAST( blue()), DOUBLE_CAST( alpha()),
             current.hue, current.saturation, current.lightness};
}

Color::operator std::string() const
{
    return toHex( true, true, false);
}

bool Color::operator==( const Color& other) const noexcept
{
    return equal( other);
}

bool Color::operator!=( const Color& other) const noexcept
{
    return !equal( other);
}

std::ostream& operator<<( std::ostream& s, const Color& c)
{
    s << static_cast<std::string>( c);
    return s;
}
