#include <algorithm>
#include <array>
#include <cstdio>
#include <string_view>
#include "chromatic.hpp"
#include "option_defs.hpp"
#include "codecs/hex_codec.hpp"
#include "parsers/command_line_parsers.hpp"
#include "parsers/option-builder.hpp"
#include "utils/color_utils.hpp"

CommandLineParser::CommandLineParser( int ac, const char * const *av)
: argc( ac), argv( av)
{
}

ApplicationDirector CommandLineParser::process()
{
    ApplicationDirector director;

#define $(key, value) value

    OptionBuilder builder( argc, argv);
    builder.addPositionalConsumer([&director]( auto *token, int)
    {
        director.colors.emplace_back( token);
    });
    builder.addMismatchConsumer([&director]( auto *token, int)
    {
        director.unknown_options.emplace_back( token);
    });
    builder.addOption( HELP_PROMPT,       SHORT( HELP_PROMPT))
           .addOption( LIST_COLORS,       SHORT( LIST_COLORS))
           .addOption( AS_HEX,            SHORT( AS_HEX))
           .addOption( AS_RGB,            SHORT( AS_RGB))
           .addOption( AS_HSL,            SHORT( AS_HSL))
           .addOption( INFO,              SHORT( INFO))
           .addOption( NO_ALPHA)
           .addOption( NO_HASH)
           .addOption( UPPER_CASE,        SHORT( UPPER_CASE))
           .addOption( COMPLEMENT,        SHORT( COMPLEMENT))
           .addOption( INVERT,            SHORT( INVERT))
           .addOption( GRAYSCALE,         SHORT( GRAYSCALE))
           .addOption( LIGHTEN,           nullptr, $(DEFAULT, "0"), $(ARG, 1))
           .addOption( DARKEN,            nullptr, $(DEFAULT, "0"), $(ARG, 1))
           .addOption( MIX,               SHORT( MIX), $(DEFAULT, ""), $(ARG, 1))
           .addOption( MIX_RATIO,         nullptr, $(DEFAULT, "0.5"), $(ARG, 1))
           .addOption( AVERAGE,           SHORT( AVERAGE))
           .addOption( CONTRAST,          SHORT( CONTRAST), $(DEFAULT, ""), $(ARG, 1))
           .addOption( BEST_TEXT,         SHORT( BEST_TEXT))
           .addOption( LIGHT_TEXT,        nullptr, $(DEFAULT, DEFAULT_LIGHT_TEXT), $(ARG, 1))
           .addOption( DARK_TEXT,         nullptr, $(DEFAULT, DEFAULT_DARK_TEXT), $(ARG, 1))
           .addOption( PREVIEW,           SHORT( PREVIEW))
           .addOption( VERBOSE,           SHORT( VERBOSE))
           .build();

#undef $

    director.show_help   = builder.asBool( HELP_PROMPT);
    director.list_colors = builder.asBool( LIST_COLORS);
    director.preview     = builder.asBool( PREVIEW);
    director.verbose     = builder.asBool( VERBOSE);

    if( builder.asBool( INFO))
        director.out_format = OutputFormat::Info;
    else if( builder.asBool( AS_HSL))
        director.out_format = OutputFormat::Hsl;
    else if( builder.asBool( AS_RGB))
        director.out_format = OutputFormat::Rgb;
    else
        director.out_format = OutputFormat::Hex;

    director.include_alpha = !builder.asBool( NO_ALPHA);
    director.include_hash  = !builder.asBool( NO_HASH);
    director.upper_case    = builder.asBool( UPPER_CASE);

    auto number = [ &builder, &director]( const char *key, double &value)
    {
        if( !builder.asDouble( key, value))
            director.invalid_numbers.emplace_back( key);
    };

    number( MIX_RATIO, director.mix_ratio);
    director.light_text    = builder.asDefault( LIGHT_TEXT);
    director.dark_text     = builder.asDefault( DARK_TEXT);

    // Only one transformation runs, the first one listed here wins.
    if( builder.asBool( COMPLEMENT))
        director.operation = Operation::Complement;
    else if( builder.asBool( INVERT))
        director.operation = Operation::Invert;
    else if( builder.asBool( GRAYSCALE))
        director.operation = Operation::Grayscale;
    else if( builder.asBool( LIGHTEN))
    {
        director.operation = Operation::Lighten;
        number( LIGHTEN, director.amount);
    }
    else if( builder.asBool( DARKEN))
    {
        director.operation = Operation::Darken;
        number( DARKEN, director.amount);
    }
    else if( builder.asBool( MIX))
    {
        director.operation = Operation::Mix;
        director.mix_with  = builder.asDefault( MIX);
    }
    else if( builder.asBool( AVERAGE))
        director.operation = Operation::Average;
    else if( builder.asBool( CONTRAST))
    {
        director.operation     = Operation::Contrast;
        director.contrast_with = builder.asDefault( CONTRAST);
    }
    else if( builder.asBool( BEST_TEXT))
        director.operation = Operation::BestText;

    return director;
}

void CommandLineParser::helpMe( std::string_view program, FILE *destination)
{
    std::array<std::string_view, OPTIONS_COUNT> options =
    {
        STRUCTURE_PREFIX( HELP_PROMPT),
        STRUCTURE_PREFIX( LIST_COLORS),
        STRUCTURE_PREFIX( AS_HEX),
        STRUCTURE_PREFIX( AS_RGB),
        STRUCTURE_PREFIX( AS_HSL),
        STRUCTURE_PREFIX( INFO),
        LONG_PREFIX( NO_ALPHA),
        LONG_PREFIX( NO_HASH),
        STRUCTURE_PREFIX( UPPER_CASE),
        STRUCTURE_PREFIX( COMPLEMENT),
        STRUCTURE_PREFIX( INVERT),
        STRUCTURE_PREFIX( GRAYSCALE),
        LONG_PREFIX( LIGHTEN) "=N",
        LONG_PREFIX( DARKEN) "=N",
        STRUCTURE_PREFIX( MIX) "=COLOR",
        LONG_PREFIX( MIX_RATIO) "=F",
        STRUCTURE_PREFIX( AVERAGE),
        STRUCTURE_PREFIX( CONTRAST) "=COLOR",
        STRUCTURE_PREFIX( BEST_TEXT),
        LONG_PREFIX( LIGHT_TEXT) "=COLOR",
        LONG_PREFIX( DARK_TEXT) "=COLOR",
        STRUCTURE_PREFIX( PREVIEW),
        STRUCTURE_PREFIX( VERBOSE)
    };
    std::array<std::string_view, OPTIONS_COUNT> options_message =
    {
        MESSAGE( HELP_PROMPT),
        MESSAGE( LIST_COLORS),
        MESSAGE( AS_HEX),
        MESSAGE( AS_RGB),
        MESSAGE( AS_HSL),
        MESSAGE( INFO),
        MESSAGE( NO_ALPHA),
        MESSAGE( NO_HASH),
        MESSAGE( UPPER_CASE),
        MESSAGE( COMPLEMENT),
        MESSAGE( INVERT),
        MESSAGE( GRAYSCALE),
        MESSAGE( LIGHTEN),
        MESSAGE( DARKEN),
        MESSAGE( MIX),
        MESSAGE( MIX_RATIO),
        MESSAGE( AVERAGE),
        MESSAGE( CONTRAST),
        MESSAGE( BEST_TEXT),
        MESSAGE( LIGHT_TEXT),
        MESSAGE( DARK_TEXT),
        MESSAGE( PREVIEW),
        MESSAGE( VERBOSE)
    };

    size_t max_length{};
    std::for_each( std::cbegin( options), std::cend( options),
                   [ &max_length]( auto each){ max_length = std::max( max_length, each.size());});

    auto slash = program.rfind( '/');
    if( slash != std::string_view::npos)
        program.remove_prefix( slash + 1);
    fprintf( destination, "Usage: %.*s [OPTION]... COLOR...\n", INT_CAST( program.size()), program.data());
    fprintf( destination, "Convert, inspect and transform each COLOR given as CSS hex digits or keyword\n\n");
    fprintf( destination, "The following options can be used to tune the output:\n");
    for( size_t j = 0; j < OPTIONS_COUNT; ++j)
        fprintf( destination, "%-*.*s  %.*s\n", INT_CAST( max_length), INT_CAST( options[ j].size()), options[ j].data(),
                 INT_CAST( options_message[ j].size()), options_message[ j].data());
    fprintf( destination, "NB! The color names available are compliant with those defined\n"
                          "by CSS standard(https://www.w3.org/TR/css-color-3/)\n");
}

void CommandLineParser::listColors( FILE *destination)
{
    fprintf( destination, "Available colors:\n");
    for( auto& [ name, code] : ColorUtil::colorTable())
        fprintf( destination, "%-22.*s %s\n", INT_CAST( name.size()), name.data(),
                 HexCodec::fromBytes( HexCodec::unpack( code)).c_str());
}
