#include <cmath>
#include <string>
#include "chromatic.hpp"
#include "color_error.hpp"
#include "utils/component.hpp"
#include "utils/utils.hpp"

uint8_t Component::toByte( std::string_view channel) const
{
    if( auto *byte = std::get_if<int64_t>( &value))
    {
        if( *byte < 0 || *byte > RGB_SCALE)
            throw InvalidComponent( channel, "byte " + std::to_string( *byte) + " is outside [0, 255]");
        return static_cast<uint8_t>( *byte);
    }

    auto fraction = std::get<double>( value);
    // NaN fails both comparisons.
    if( !( fraction >= 0. && fraction <= 1.))
        throw InvalidComponent( channel, "fraction " + Util::formatNumber( fraction) + " is outside [0.0, 1.0]");

    return static_cast<uint8_t>( std::round( fraction * RGB_SCALE));
}
