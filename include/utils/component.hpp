#ifndef COMPONENT_HPP
#define COMPONENT_HPP

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <variant>

/*
 * One color channel as handed over by a caller.
 * Integral arguments are bytes in [0, 255], floating arguments are fractions in [0, 1].
 * The representation is picked by the argument type, never by its magnitude:
 * `1` is the byte 1 while `1.0` is the fraction 1 ( byte 255).
 */
class Component
{
public:
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Component( T byte)
    : value( static_cast<int64_t>( byte))
    {
    }

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Component( T fraction)
    : value( static_cast<double>( fraction))
    {
    }

    [[nodiscard]] bool isFraction() const
    {
        return std::holds_alternative<double>( value);
    }

    /*
     * Validates the channel and maps it onto [0, 255].
     * `channel` names the argument in the InvalidComponent message.
     */
    [[nodiscard]] uint8_t toByte( std::string_view channel = "component") const;

private:
    std::variant<int64_t, double> value;
};

#endif //COMPONENT_HPP
