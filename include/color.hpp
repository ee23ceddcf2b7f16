#ifndef COLOR_HPP
#define COLOR_HPP

#include <array>
#include <atomic>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include "chromatic.hpp"
#include "utils/accessibility.hpp"
#include "utils/component.hpp"

class Color;

/*
 * A text color candidate, either a CSS keyword or a ready made color.
 */
using ColorReference = std::variant<std::string, Color>;

/*
 * Immutable sRGB color.
 * The four bytes are the only state, HSL and luminance are derived on first
 * use and cached. Caches are published through atomics so that concurrent
 * readers of one instance are safe; copies always start with empty caches.
 */
class Color
{
public:
    // Opaque black.
    Color() noexcept;

    /*
     * Accepts CSS hex notation or a CSS keyword, case-insensitive.
     * Throws InvalidColorString when neither grammar matches.
     */
    explicit Color( std::string_view color);

    explicit Color( const Rgba& rgba) noexcept;

    static Color fromRgba( Component red, Component green, Component blue, Component alpha = RGB_SCALE);

    static Color fromHsla( double hue, double saturation, double lightness, Component alpha = RGB_SCALE);

    static Color fromHex( std::string_view hex);

    static Color fromName( std::string_view name);

    /*
     * Rounded per channel mean, throws EmptyInput for no colors.
     */
    static Color average( const std::vector<Color>& colors);

    template <typename... Colors>
    static Color average( const Colors&... colors)
    {
        static_assert(( std::is_same_v<Colors, Color> && ...), "average() only accepts colors");
        return average( std::vector<Color>{ colors...});
    }

    [[nodiscard]] uint8_t red() const noexcept { return rgba[ ENUM_CAST( Channel::Red)]; }
    [[nodiscard]] uint8_t green() const noexcept { return rgba[ ENUM_CAST( Channel::Green)]; }
    [[nodiscard]] uint8_t blue() const noexcept { return rgba[ ENUM_CAST( Channel::Blue)]; }
    [[nodiscard]] uint8_t alpha() const noexcept { return rgba[ ENUM_CAST( Channel::Alpha)]; }

    [[nodiscard]] double hue() const;
    [[nodiscard]] double saturation() const;
    [[nodiscard]] double lightness() const;
    [[nodiscard]] double relativeLuminance() const;
    [[nodiscard]] double perceivedLightness() const;

    [[nodiscard]] Color withRed( Component red) const;
    [[nodiscard]] Color withGreen( Component green) const;
    [[nodiscard]] Color withBlue( Component blue) const;
    [[nodiscard]] Color withAlpha( Component alpha) const;
    [[nodiscard]] Color withHue( double hue) const;
    [[nodiscard]] Color withSaturation( double saturation) const;
    [[nodiscard]] Color withLightness( double lightness) const;

    /*
     * Per channel interpolation towards `other`; 0 yields this color, 1 yields `other`.
     */
    [[nodiscard]] Color mix( const Color& other, double fraction = .5) const;

    // Hue rotated by 180 degrees.
    [[nodiscard]] Color complement() const;
    [[nodiscard]] Color invert() const;
    [[nodiscard]] Color grayscale() const;
    [[nodiscard]] Color lighten( double amount) const;
    [[nodiscard]] Color darken( double amount) const;

    [[nodiscard]] double contrastRatio( const Color& other) const;

    [[nodiscard]] bool meetsContrast( const Color& other, Accessibility::Level level = Accessibility::Level::AA,
                                      bool large_text = false) const;

    /*
     * Picks the more readable of `light` and `dark` on this background.
     * Equal contrast favors `dark`. Keywords that are not in the table throw InvalidName.
     */
    [[nodiscard]] Color bestTextColor() const;
    [[nodiscard]] Color bestTextColor( const ColorReference& light, const ColorReference& dark) const;

    [[nodiscard]] std::string_view closestName() const;

    [[nodiscard]] bool equal( const Color& other) const noexcept;

    [[nodiscard]] std::string toHex( bool include_alpha = true, bool include_hash = true,
                                     bool upper_case = false) const;
    [[nodiscard]] std::string toRgbString() const;
    [[nodiscard]] std::string toHslString() const;
    [[nodiscard]] Rgba toRgbaArray() const noexcept;
    // Hue, saturation, lightness and alpha as a fraction.
    [[nodiscard]] std::array<double, 4> toHslArray() const;
    // Red, green, blue, alpha bytes followed by hue, saturation and lightness.
    [[nodiscard]] std::array<double, 7> toArray() const;

    explicit operator std::string() const;

    bool operator==( const Color& other) const noexcept;
    bool operator!=( const Color& other) const noexcept;

private:
    struct DerivedCache
    {
        DerivedCache() = default;
        DerivedCache( const DerivedCache&) noexcept
        {
        }
        DerivedCache& operator=( const DerivedCache&) noexcept;

        std::atomic<bool>   hsl_ready{ false},
                            luminance_ready{ false},
                            perceived_ready{ false};
        std::atomic<double> hue{},
                            saturation{},
                            lightness{},
                            luminance{},
                            perceived{};
    };

    [[nodiscard]] HslColor hsl() const;

    Rgba rgba{ 0, 0, 0, RGB_SCALE};
    mutable DerivedCache cache;
};

std::ostream& operator<<( std::ostream& s, const Color& c);

#endif //COLOR_HPP
