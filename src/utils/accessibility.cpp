#include <algorithm>
#include <cmath>
#include "chromatic.hpp"
#include "utils/accessibility.hpp"
#include "utils/utils.hpp"

namespace Accessibility
{
    double gamma( uint8_t channel)
    {
        double component = DOUBLE_CAST( channel) / RGB_SCALE;
        return component <= 0.03928 ? component / 12.92
                                    : std::pow(( component + 0.055) / 1.055, 2.4);
    }

    double relativeLuminance( uint8_t red, uint8_t green, uint8_t blue)
    {
        return 0.2126 * gamma( red) + 0.7152 * gamma( green) + 0.0722 * gamma( blue);
    }

    double perceivedLightness( double luminance)
    {
        // 0.008856 = (6/29)^3, 903.3 = (29/3)^3
        double lightness = luminance <= 0.008856 ? luminance * 903.3 / PERCENT
                                                 : 1.16 * std::cbrt( luminance) - 0.16;
        return Util::clamp( lightness, 0., 1.);
    }

    double contrastRatio( double luminance_a, double luminance_b)
    {
        auto lighter = std::max( luminance_a, luminance_b),
             darker  = std::min( luminance_a, luminance_b);
        return ( lighter + 0.05) / ( darker + 0.05);
    }

    double minimumContrast( Level level, bool large_text)
    {
        if( level == Level::AAA)
            return large_text ? 4.5 : 7.;
        return large_text ? 3. : 4.5;
    }
}
