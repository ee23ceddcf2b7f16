#ifndef COMMAND_LINE_PARSERS_HPP
#define COMMAND_LINE_PARSERS_HPP

#include <cstdio>
#include <string_view>
#include "chromatic.hpp"

class CommandLineParser
{
public:
    CommandLineParser( int ac, const char * const *av);

    [[nodiscard]] ApplicationDirector process();

    static void helpMe( std::string_view program, FILE *destination = stdout);

    static void listColors( FILE *destination = stdout);

private:
    int argc;
    const char * const *argv;
};

#endif
