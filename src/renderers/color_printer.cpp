#include <cstdlib>
#include <iostream>
#include "renderers/color_printer.hpp"
#include "utils/color_utils.hpp"
#include "utils/utils.hpp"

ColorPrinter::ColorPrinter( const ApplicationDirector& director, FILE *destination)
: app_manager_( director), destination_( destination)
{
}

void ColorPrinter::print() const
{
    if( app_manager_.colors.empty())
        throw EmptyInput( PROJECT_NAME);

    std::vector<Color> colors;
    colors.reserve( app_manager_.colors.size());
    for( auto spec : app_manager_.colors)
    {
        colors.emplace_back( spec);
        if( app_manager_.verbose)
            std::clog << "Parsed `" << spec << "` as " << colors.back() << '\n';
    }

    if( app_manager_.operation == Operation::Average)
    {
        auto mean = Color::average( colors);
        if( app_manager_.verbose)
            std::clog << "Averaged " << colors.size() << " colors into " << mean << '\n';
        printColor( mean);
        return;
    }

    for( auto& color : colors)
    {
        if( app_manager_.operation == Operation::Contrast)
            printContrast( color);
        else
            printColor( transform( color));
    }
}

Color ColorPrinter::transform( const Color& color) const
{
    switch( app_manager_.operation)
    {
        case Operation::Complement:
            return color.complement();
        case Operation::Invert:
            return color.invert();
        case Operation::Grayscale:
            return color.grayscale();
        case Operation::Lighten:
            return color.lighten( app_manager_.amount);
        case Operation::Darken:
            return color.darken( app_manager_.amount);
        case Operation::Mix:
        {
            auto other = Color( app_manager_.mix_with);
            if( app_manager_.verbose)
                std::clog << "Mixing " << color << " with " << other
                          << " at " << app_manager_.mix_ratio << '\n';
            return color.mix( other, app_manager_.mix_ratio);
        }
        case Operation::BestText:
        {
            auto light = Color( app_manager_.light_text),
                 dark  = Color( app_manager_.dark_text);
            if( app_manager_.verbose)
                std::clog << "Contrast against light " << light << ": " << color.contrastRatio( light)
                          << ", against dark " << dark << ": " << color.contrastRatio( dark) << '\n';
            return color.bestTextColor( light, dark);
        }
        default:
            return color;
    }
}

std::string ColorPrinter::format( const Color& color) const
{
    switch( app_manager_.out_format)
    {
        case OutputFormat::Rgb:
            return color.toRgbString();
        case OutputFormat::Hsl:
            return color.toHslString();
        default:
            return color.toHex( app_manager_.include_alpha, app_manager_.include_hash, app_manager_.upper_case);
    }
}

void ColorPrinter::printColor( const Color& color) const
{
    if( app_manager_.out_format == OutputFormat::Info)
    {
        printInfo( color);
        return;
    }

    printSwatch( color);
    fprintf( destination_, "%s\n", format( color).c_str());
}

void ColorPrinter::printInfo( const Color& color) const
{
    auto name = color.closestName();
    printSwatch( color);
    fprintf( destination_, "%s\n", color.toHex( app_manager_.include_alpha,
                                                app_manager_.include_hash, app_manager_.upper_case).c_str());
    fprintf( destination_, "  %-20s %s\n", "rgb:", color.toRgbString().c_str());
    fprintf( destination_, "  %-20s %s\n", "hsl:", color.toHslString().c_str());
    fprintf( destination_, "  %-20s %.4f\n", "luminance:", color.relativeLuminance());
    fprintf( destination_, "  %-20s %.4f\n", "perceived lightness:", color.perceivedLightness());
    fprintf( destination_, "  %-20s %.*s\n", "closest keyword:", INT_CAST( name.size()), name.data());
}

void ColorPrinter::printContrast( const Color& color) const
{
    auto other = Color( app_manager_.contrast_with);
    auto ratio = color.contrastRatio( other);
    auto verdict = [ &color, &other]( Accessibility::Level level, bool large_text)
    {
        return color.meetsContrast( other, level, large_text) ? "pass" : "fail";
    };

    fprintf( destination_, "%s on %s: %.2f:1\n", format( color).c_str(), format( other).c_str(), ratio);
    fprintf( destination_, "  AA  normal text: %s, large text: %s\n",
             verdict( Accessibility::Level::AA, false), verdict( Accessibility::Level::AA, true));
    fprintf( destination_, "  AAA normal text: %s, large text: %s\n",
             verdict( Accessibility::Level::AAA, false), verdict( Accessibility::Level::AAA, true));
}

void ColorPrinter::printSwatch( const Color& color) const
{
#if ANSI_PREVIEW_SUPPORTED
    auto *no_color = getenv( "NO_COLOR");
    if( !app_manager_.preview || ( ACCESSIBLE( no_color) && *no_color != '\0'))
        return;
    fprintf( destination_, "\x1B[48;2;%d;%d;%dm      \x1B[0m ", color.red(), color.green(), color.blue());
#else
    ( void)color;
#endif
}

void ColorPrinter::reportFailure( const ColorError& error, FILE *destination)
{
    fprintf( destination, "%s\n", error.what());

    std::string unknown;
    if( auto *name_error = dynamic_cast<const InvalidName *>( &error))
        unknown = name_error->name();
    else if( auto *spec_error = dynamic_cast<const InvalidColorString *>( &error))
        unknown = spec_error->input();
    if( unknown.empty())
        return;

    auto matches = ColorUtil::suggestNames( unknown);
    if( !matches.empty())
    {
        fprintf( destination, "The following colors match your search:\n");
        for( size_t i = 0; i < matches.size(); ++i)
            fprintf( destination, "%zu]. %s\n", i + 1, matches[ i].c_str());
    }
}
