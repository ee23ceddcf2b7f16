#include <algorithm>
#include <cctype>
#include <cstdio>
#include <functional>
#include "chromatic.hpp"
#include "color_error.hpp"
#include "codecs/hex_codec.hpp"
#include "utils/utils.hpp"

std::string_view HexCodec::stripHash( std::string_view hex) noexcept
{
    if( !hex.empty() && hex.front() == '#')
        hex.remove_prefix( 1);
    return hex;
}

bool HexCodec::valid( std::string_view hex) noexcept
{
    auto digits = stripHash( hex);
    return Util::compareOr<std::equal_to<size_t>>( digits.size(), 3u, 4u, 6u, 8u)
           && std::all_of( digits.cbegin(), digits.cend(), []( unsigned char c){ return isxdigit( c) != 0; });
}

std::string HexCodec::normalize( std::string_view hex)
{
    if( !valid( hex))
        throw InvalidHex( hex);

    auto digits = Util::toLower( stripHash( hex));
    std::string normal;
    normal.reserve( HEX_DIGITS);
    if( digits.size() <= 4)
    {
        for( auto digit : digits)
            normal.append( 2, digit);
    }
    else
        normal = digits;

    if( normal.size() == 6)
        normal += "ff";

    return normal;
}

Rgba HexCodec::toBytes( std::string_view hex)
{
    auto normal = normalize( hex);
    const char *ctx = normal.c_str();
    Rgba bytes{};
    for( auto& byte : bytes)
        byte = static_cast<uint8_t>( Util::getNumber( ctx, 16, 2));

    return bytes;
}

std::string HexCodec::fromBytes( const Rgba& bytes, bool include_alpha, bool include_hash, bool upper_case)
{
    const char *format = upper_case ? "%02X" : "%02x";
    std::string hex = include_hash ? "#" : "";
    char pair[ 3];
    for( size_t i = 0, count = include_alpha ? 4 : 3; i < count; ++i)
    {
        snprintf( pair, sizeof( pair), format, bytes[ i]);
        hex += pair;
    }

    return hex;
}

uint32_t HexCodec::pack( const Rgba& bytes) noexcept
{
    return RGBA( bytes[ 0], bytes[ 1], bytes[ 2], bytes[ 3]);
}

Rgba HexCodec::unpack( uint32_t color) noexcept
{
    return { RED( color), GREEN( color), BLUE( color), ALPHA( color)};
}
