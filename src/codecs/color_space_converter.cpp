#include <cstdint>
#include <algorithm>
#include <cmath>
#include <string>
#include "color_error.hpp"
#include "codecs/color_space_converter.hpp"
#include "utils/utils.hpp"

HslColor ColorSpaceConverter::rgbToHsl( int red, int green, int blue)
{
    const char *names[] = { "red", "green", "blue"};
    int channels[] = { red, green, blue};
    for( int i = 0; i < 3; ++i)
    {
        if( channels[ i] < 0 || channels[ i] > RGB_SCALE)
            throw InvalidComponent( names[ i], "byte " + std::to_string( channels[ i]) + " is outside [0, 255]");
    }

    auto c_max = std::max( std::max( red, green), blue),
         c_min = std::min( std::min( red, green), blue),
         delta = c_max - c_min;

    HslColor hsl;
    hsl.lightness = DOUBLE_CAST( c_max + c_min) / ( 2 * RGB_SCALE);
    if( delta == 0)
        return hsl;

    // 1 - |2L - 1| scaled by 255, kept integral so that pure hues come out exact.
    auto spread = RGB_SCALE - std::abs( c_max + c_min - RGB_SCALE);
    hsl.saturation = std::min( DOUBLE_CAST( delta) / spread, 1.);

    double segment;
    if( c_max == red)
        segment = std::fmod( DOUBLE_CAST( green - blue) / delta, 6.);
    else if( c_max == green)
        segment = DOUBLE_CAST( blue - red) / delta + 2;
    else
        segment = DOUBLE_CAST( red - green) / delta + 4;

    hsl.hue = normalizeHue( segment * DEG_SECTOR);

    return hsl;
}

std::array<uint8_t, 3> ColorSpaceConverter::hslToRgb( double hue, double saturation, double lightness)
{
    if( !std::isfinite( hue))
        throw InvalidComponent( "hue", Util::formatNumber( hue) + " is not a finite angle");
    if( !( saturation >= 0. && saturation <= 1.))
        throw InvalidComponent( "saturation", Util::formatNumber( saturation) + " is outside [0.0, 1.0]");
    if( !( lightness >= 0. && lightness <= 1.))
        throw InvalidComponent( "lightness", Util::formatNumber( lightness) + " is outside [0.0, 1.0]");

    double sector = normalizeHue( hue) / DEG_SECTOR,
           chroma = ( 1 - std::abs( 2 * lightness - 1)) * saturation,
           x      = chroma * ( 1 - std::abs( std::fmod( sector, 2.) - 1)),
           m      = lightness - chroma / 2;

    double r, g, b;
    switch( INT_CAST( sector))
    {
        case 0:
            r = chroma, g = x, b = 0;
            break;
        case 1:
            r = x, g = chroma, b = 0;
            break;
        case 2:
            r = 0, g = chroma, b = x;
            break;
        case 3:
            r = 0, g = x, b = chroma;
            break;
        case 4:
            r = x, g = 0, b = chroma;
            break;
        default:
            r = chroma, g = 0, b = x;
            break;
    }

    return { toChannel( r + m), toChannel( g + m), toChannel( b + m)};
}

double ColorSpaceConverter::normalizeHue( double hue)
{
    hue = std::fmod( hue, DEG_MAX);
    if( hue < 0)
        hue += DEG_MAX;
    // fmod of a tiny negative angle lands on 360 after the shift.
    if( hue >= DEG_MAX)
        hue = 0;

    return hue;
}

uint8_t ColorSpaceConverter::toChannel( double value)
{
    return static_cast<uint8_t>( Util::clamp( std::round( value * RGB_SCALE), 0, RGB_SCALE));
}
