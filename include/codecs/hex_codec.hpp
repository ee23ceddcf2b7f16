#ifndef HEX_CODEC_HPP
#define HEX_CODEC_HPP

#include <string>
#include <string_view>
#include "chromatic.hpp"

/*
 * CSS hex notation: `#rgb`, `#rgba`, `#rrggbb` and `#rrggbbaa`, the `#` being optional.
 */
class HexCodec
{
public:
    /*
     * Expands the given hex into 8 lowercase digits without `#`.
     * Short forms double each digit, forms without alpha get `ff`.
     * Throws InvalidHex.
     */
    static std::string normalize( std::string_view hex);

    static bool valid( std::string_view hex) noexcept;

    static Rgba toBytes( std::string_view hex);

    static std::string fromBytes( const Rgba& bytes, bool include_alpha = true,
                                  bool include_hash = true, bool upper_case = false);

    static uint32_t pack( const Rgba& bytes) noexcept;

    static Rgba unpack( uint32_t color) noexcept;

private:
    static std::string_view stripHash( std::string_view hex) noexcept;
};

#endif //HEX_CODEC_HPP
