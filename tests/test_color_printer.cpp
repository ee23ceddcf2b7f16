#include <cstdio>
#include <cstdlib>
#include <string>
#include "chromatic.hpp"
#include "color_error.hpp"
#include "renderers/color_printer.hpp"
#include "CppUTest/TestHarness.h"

TEST_GROUP(ColorPrinterTests)
{
    FILE *destination = nullptr;
    ApplicationDirector director;

    void setup() override
    {
        destination = tmpfile();
        CHECK( destination != nullptr);
    }

    void teardown() override
    {
        fclose( destination);
    }

    void reset()
    {
        fclose( destination);
        destination = tmpfile();
        CHECK( destination != nullptr);
    }

    std::string output()
    {
        std::string content;
        rewind( destination);
        int c;
        while(( c = fgetc( destination)) != EOF)
            content += static_cast<char>( c);
        return content;
    }

    std::string print()
    {
        ColorPrinter( director, destination).print();
        return output();
    }
};

TEST( ColorPrinterTests, HexByDefault)
{
    director.colors = { "#FF8040", "navy"};
    STRCMP_EQUAL( "#ff8040ff\n#000080ff\n", print().c_str());
}

TEST( ColorPrinterTests, HexFormatting)
{
    director.colors        = { "#ff8040"};
    director.include_alpha = false;
    director.include_hash  = false;
    director.upper_case    = true;
    STRCMP_EQUAL( "FF8040\n", print().c_str());
}

TEST( ColorPrinterTests, RgbAndHsl)
{
    director.colors     = { "red"};
    director.out_format = OutputFormat::Rgb;
    STRCMP_EQUAL( "rgb(255 0 0 / 1)\n", print().c_str());

    reset();
    director.out_format = OutputFormat::Hsl;
    STRCMP_EQUAL( "hsl(0deg 100% 50% / 1)\n", print().c_str());
}

TEST( ColorPrinterTests, OperationsApplyToEveryColor)
{
    director.colors    = { "red", "blue"};
    director.operation = Operation::Complement;
    STRCMP_EQUAL( "#00ffffff\n#ffff00ff\n", print().c_str());
}

TEST( ColorPrinterTests, Average)
{
    director.colors    = { "red", "blue"};
    director.operation = Operation::Average;
    STRCMP_EQUAL( "#800080ff\n", print().c_str());
}

TEST( ColorPrinterTests, MixAndLighten)
{
    director.colors    = { "black"};
    director.operation = Operation::Mix;
    director.mix_with  = "white";
    director.mix_ratio = .5;
    STRCMP_EQUAL( "#808080ff\n", print().c_str());

    reset();
    director.colors    = { "red"};
    director.operation = Operation::Lighten;
    director.amount    = .5;
    STRCMP_EQUAL( "#ffffffff\n", print().c_str());
}

TEST( ColorPrinterTests, Contrast)
{
    director.colors        = { "black"};
    director.operation     = Operation::Contrast;
    director.contrast_with = "#fff";
    STRCMP_EQUAL( "#000000ff on #ffffffff: 21.00:1\n"
                  "  AA  normal text: pass, large text: pass\n"
                  "  AAA normal text: pass, large text: pass\n", print().c_str());
}

TEST( ColorPrinterTests, BestText)
{
    director.colors    = { "#336699", "yellow"};
    director.operation = Operation::BestText;
    STRCMP_EQUAL( "#ffffffff\n#000000ff\n", print().c_str());

    reset();
    director.colors     = { "#336699"};
    director.light_text = "#eee";
    director.dark_text  = "#111";
    STRCMP_EQUAL( "#eeeeeeff\n", print().c_str());
}

TEST( ColorPrinterTests, Info)
{
    director.colors     = { "#fe6347"};
    director.out_format = OutputFormat::Info;
    auto text = print();
    STRCMP_CONTAINS( "#fe6347ff\n", text.c_str());
    STRCMP_CONTAINS( "rgb(254 99 71 / 1)", text.c_str());
    STRCMP_CONTAINS( "luminance:", text.c_str());
    STRCMP_CONTAINS( "perceived lightness:", text.c_str());
    STRCMP_CONTAINS( "tomato", text.c_str());
}

TEST( ColorPrinterTests, Failures)
{
    CHECK_THROWS( EmptyInput, ColorPrinter( director, destination).print());

    director.colors = { "red", "notacolor"};
    CHECK_THROWS( InvalidColorString, ColorPrinter( director, destination).print());

    director.colors    = { "red"};
    director.operation = Operation::Darken;
    director.amount    = 2;
    CHECK_THROWS( InvalidComponent, ColorPrinter( director, destination).print());
}

TEST( ColorPrinterTests, ReportFailureSuggestsKeywords)
{
    ColorPrinter::reportFailure( InvalidColorString( "gren"), destination);
    auto text = output();
    STRCMP_CONTAINS( "Invalid color specification `gren`", text.c_str());
    STRCMP_CONTAINS( "The following colors match your search:", text.c_str());
    STRCMP_CONTAINS( "green", text.c_str());
}

TEST( ColorPrinterTests, ReportFailureWithoutSuggestions)
{
    ColorPrinter::reportFailure( EmptyInput( "average"), destination);
    STRCMP_EQUAL( "average requires at least one color\n", output().c_str());
}

#if ANSI_PREVIEW_SUPPORTED
TEST( ColorPrinterTests, PreviewSwatch)
{
    unsetenv( "NO_COLOR");
    director.colors  = { "#102030"};
    director.preview = true;
    STRCMP_EQUAL( "\x1B[48;2;16;32;48m      \x1B[0m #102030ff\n", print().c_str());
}

TEST( ColorPrinterTests, NoColorDisablesPreview)
{
    setenv( "NO_COLOR", "1", 1);
    director.colors  = { "#102030"};
    director.preview = true;
    STRCMP_EQUAL( "#102030ff\n", print().c_str());
    unsetenv( "NO_COLOR");
}
#endif
