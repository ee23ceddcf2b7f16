/***************************************************************************/
/*                                                                         */
/*  chromatic.cpp                                                          */
/*                                                                         */
/*    A terminal based color conversion and accessibility utility          */
/*                                                                         */
/*  Copyright 2022 by Adesina Meekness                                     */
/*                                                                         */
/*                                                                         */
/*       ##    ## ##                                                       */
/*       ##    ##  #                                                       */
/*       ###  ###  #  ##                                                   */
/*       # # # ##  # #                                                     */
/* ####  # ### ##  ###                                                     */
/*       #  #  ##  # ##                                                    */
/*       #  #  ##  #  ##                                                   */
/*                                                                         */
/*                                                                         */
/*  This file is part of the Chromatic project, and may only be used,      */
/*  modified, and distributed under the terms of the GNU project           */
/*  license, LICENSE.TXT.  By continuing to use, modify, or distribute     */
/*  this file you indicate that you have read the license and              */
/*  understand and accept it fully.                                        */
/*                                                                         */
/***************************************************************************/

#include <cstdlib>
#include <iostream>
#include "chromatic.hpp"
#include "color_error.hpp"
#include "parsers/command_line_parsers.hpp"
#include "renderers/color_printer.hpp"

int main( int argc, char *argv[])
{
    auto cmd_parser        = CommandLineParser( argc, argv);
    auto activity_director = cmd_parser.process();

    if( !activity_director.unknown_options.empty())
    {
        for( auto option : activity_director.unknown_options)
            fprintf( stderr, "Unknown option `%.*s`\n", INT_CAST( option.size()), option.data());
        fprintf( stderr, "Try `%s --help` for more information.\n", argv[ 0]);
        return EXIT_FAILURE;
    }

    if( !activity_director.invalid_numbers.empty())
    {
        for( auto option : activity_director.invalid_numbers)
            fprintf( stderr, "Option `--%.*s` expects a number\n", INT_CAST( option.size()), option.data());
        return EXIT_FAILURE;
    }

    if( activity_director.show_help)
    {
        CommandLineParser::helpMe( argv[ 0]);
        return EXIT_SUCCESS;
    }

    if( activity_director.list_colors)
    {
        CommandLineParser::listColors();
        return EXIT_SUCCESS;
    }

    if( activity_director.verbose)
        std::clog << PROJECT_NAME << ' ' << PROJECT_VERSION << ": "
                  << activity_director.colors.size() << " color(s) given\n";

    try
    {
        ColorPrinter( activity_director).print();
    }
    catch( const ColorError& error)
    {
        ColorPrinter::reportFailure( error);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
