#ifndef COLOR_SPACE_CONVERTER_HPP
#define COLOR_SPACE_CONVERTER_HPP

#include "chromatic.hpp"

class ColorSpaceConverter
{
public:
    /*
     * Channels must be in [0, 255], otherwise InvalidComponent is thrown.
     */
    static HslColor rgbToHsl( int red, int green, int blue);

    /*
     * Exact inverse of rgbToHsl for every byte triple.
     * Hue is taken modulo 360, saturation and lightness must be in [0, 1].
     */
    static std::array<uint8_t, 3> hslToRgb( double hue, double saturation, double lightness);

    static double normalizeHue( double hue);

private:
    static uint8_t toChannel( double value);
};

#endif
