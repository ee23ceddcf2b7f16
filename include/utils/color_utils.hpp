#ifndef COLOR_UTILS_HPP
#define COLOR_UTILS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include "chromatic.hpp"

namespace ColorUtil
{
    /*
     * Keyword table in declaration order, codes packed as 0xRRGGBBAA.
     */
    const std::vector<std::pair<std::string_view, uint32_t>>& colorTable();

    std::unordered_map<std::string_view, uint32_t>& colorCodeLookup();

    bool validName( std::string_view name);

    /*
     * Both throw InvalidName for anything outside the table.
     */
    std::string nameToHex( std::string_view name);

    Rgba nameToBytes( std::string_view name);

    /*
     * Keywords within `threshold` edits of `name`, closest first.
     */
    std::vector<std::string> suggestNames( std::string_view name, int threshold = 3);

    /*
     * The keyword nearest to the given color, alpha is not considered.
     * Identical codes ( e.g. aqua and cyan) resolve to the first one declared.
     */
    std::string_view closestName( const Rgba& rgba);
}

#endif
