#ifndef COLOR_PRINTER_HPP
#define COLOR_PRINTER_HPP

#include <cstdio>
#include <string>
#include "chromatic.hpp"
#include "color.hpp"
#include "color_error.hpp"

/*
 * Runs the operation selected on the command line over the colors given
 * and writes the result in the requested notation.
 */
class ColorPrinter
{
public:
    explicit ColorPrinter( const ApplicationDirector& director, FILE *destination = stdout);

    // Throws ColorError on the first color that does not parse.
    void print() const;

    /*
     * Writes the diagnostic for `error`, followed by the closest keywords
     * when the failure came from an unknown name.
     */
    static void reportFailure( const ColorError& error, FILE *destination = stderr);

private:
    Color transform( const Color& color) const;

    void printColor( const Color& color) const;

    void printInfo( const Color& color) const;

    void printContrast( const Color& color) const;

    void printSwatch( const Color& color) const;

    std::string format( const Color& color) const;

    const ApplicationDirector& app_manager_;
    FILE *destination_;
};

#endif
