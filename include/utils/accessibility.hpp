#ifndef ACCESSIBILITY_HPP
#define ACCESSIBILITY_HPP

#include <cstdint>

/*
 * WCAG 2 readability metrics.
 * References:
 *  + https://www.w3.org/TR/WCAG20/#relativeluminancedef
 *  + https://www.w3.org/TR/WCAG20/#contrast-ratiodef
 */
namespace Accessibility
{
    enum class Level
    {
        AA,
        AAA
    };

    /*
     * sRGB transfer function, linearizes one channel.
     */
    double gamma( uint8_t channel);

    double relativeLuminance( uint8_t red, uint8_t green, uint8_t blue);

    /*
     * CIE L* scaled to [0, 1].
     */
    double perceivedLightness( double luminance);

    /*
     * Order of the arguments is irrelevant, result is in [1, 21].
     */
    double contrastRatio( double luminance_a, double luminance_b);

    double minimumContrast( Level level, bool large_text = false);
}

#endif //ACCESSIBILITY_HPP
