#include <cmath>
#include <memory>
#include "chromatic.hpp"
#include "colors_defs.hpp"
#include "color_error.hpp"
#include "codecs/hex_codec.hpp"
#include "utils/color_utils.hpp"
#include "utils/utils.hpp"

namespace ColorUtil
{
    namespace
    {
        BKNode *nameTree()
        {
            static std::shared_ptr<BKNode> bkroot = []
            {
                std::shared_ptr<BKNode> root;
                for( auto& entry : colorTable())
                    Util::insert( root, entry.first);
                return root;
            }();
            return bkroot.get();
        }

        KDNode *colorTree()
        {
            static std::shared_ptr<KDNode> kdroot = []
            {
                std::shared_ptr<KDNode> root;
                auto& table = colorTable();
                for( size_t i = 0; i < table.size(); ++i)
                {
                    auto code = table[ i].second;
                    // Fully transparent keywords carry no usable chroma.
                    if( ALPHA( code) == 0)
                        continue;
                    Util::insert( root, { RED( code), GREEN( code), BLUE( code)}, i);
                }
                return root;
            }();
            return kdroot.get();
        }
    }

    const std::vector<std::pair<std::string_view, uint32_t>>& colorTable()
    {
        static const std::vector<std::pair<std::string_view, uint32_t>> table =
        {
            { COLOR_ALICEBLUE,            COLORHEX_ALICEBLUE},
            { COLOR_ANTIQUEWHITE,         COLORHEX_ANTIQUEWHITE},
            { COLOR_AQUA,                 COLORHEX_AQUA},
            { COLOR_AQUAMARINE,           COLORHEX_AQUAMARINE},
            { COLOR_AZURE,                COLORHEX_AZURE},
            { COLOR_BEIGE,                COLORHEX_BEIGE},
            { COLOR_BISQUE,               COLORHEX_BISQUE},
            { COLOR_BLACK,                COLORHEX_BLACK},
            { COLOR_BLANCHEDALMOND,       COLORHEX_BLANCHEDALMOND},
            { COLOR_BLUE,                 COLORHEX_BLUE},
            { COLOR_BLUEVIOLET,           COLORHEX_BLUEVIOLET},
            { COLOR_BROWN,                COLORHEX_BROWN},
            { COLOR_BURLYWOOD,            COLORHEX_BURLYWOOD},
            { COLOR_CADETBLUE,            COLORHEX_CADETBLUE},
            { COLOR_CHARTREUSE,           COLORHEX_CHARTREUSE},
            { COLOR_CHOCOLATE,            COLORHEX_CHOCOLATE},
            { COLOR_CORAL,                COLORHEX_CORAL},
            { COLOR_CORNFLOWERBLUE,       COLORHEX_CORNFLOWERBLUE},
            { COLOR_CORNSILK,             COLORHEX_CORNSILK},
            { COLOR_CRIMSON,              COLORHEX_CRIMSON},
            { COLOR_CYAN,                 COLORHEX_CYAN},
            { COLOR_DARKBLUE,             COLORHEX_DARKBLUE},
            { COLOR_DARKCYAN,             COLORHEX_DARKCYAN},
            { COLOR_DARKGOLDENROD,        COLORHEX_DARKGOLDENROD},
            { COLOR_DARKGRAY,             COLORHEX_DARKGRAY},
            { COLOR_DARKGREEN,            COLORHEX_DARKGREEN},
            { COLOR_DARKGREY,             COLORHEX_DARKGREY},
            { COLOR_DARKKHAKI,            COLORHEX_DARKKHAKI},
            { COLOR_DARKMAGENTA,          COLORHEX_DARKMAGENTA},
            { COLOR_DARKOLIVEGREEN,       COLORHEX_DARKOLIVEGREEN},
            { COLOR_DARKORANGE,           COLORHEX_DARKORANGE},
            { COLOR_DARKORCHID,           COLORHEX_DARKORCHID},
            { COLOR_DARKRED,              COLORHEX_DARKRED},
            { COLOR_DARKSALMON,           COLORHEX_DARKSALMON},
            { COLOR_DARKSEAGREEN,         COLORHEX_DARKSEAGREEN},
            { COLOR_DARKSLATEBLUE,        COLORHEX_DARKSLATEBLUE},
            { COLOR_DARKSLATEGRAY,        COLORHEX_DARKSLATEGRAY},
            { COLOR_DARKSLATEGREY,        COLORHEX_DARKSLATEGREY},
            { COLOR_DARKTURQUOISE,        COLORHEX_DARKTURQUOISE},
            { COLOR_DARKVIOLET,           COLORHEX_DARKVIOLET},
            { COLOR_DEEPPINK,             COLORHEX_DEEPPINK},
            { COLOR_DEEPSKYBLUE,          COLORHEX_DEEPSKYBLUE},
            { COLOR_DIMGRAY,              COLORHEX_DIMGRAY},
            { COLOR_DIMGREY,              COLORHEX_DIMGREY},
            { COLOR_DODGERBLUE,           COLORHEX_DODGERBLUE},
            { COLOR_FIREBRICK,            COLORHEX_FIREBRICK},
            { COLOR_FLORALWHITE,          COLORHEX_FLORALWHITE},
            { COLOR_FORESTGREEN,          COLORHEX_FORESTGREEN},
            { COLOR_FUCHSIA,              COLORHEX_FUCHSIA},
            { COLOR_GAINSBORO,            COLORHEX_GAINSBORO},
            { COLOR_GHOSTWHITE,           COLORHEX_GHOSTWHITE},
            { COLOR_GOLD,                 COLORHEX_GOLD},
            { COLOR_GOLDENROD,            COLORHEX_GOLDENROD},
            { COLOR_GRAY,                 COLORHEX_GRAY},
            { COLOR_GREEN,                COLORHEX_GREEN},
            { COLOR_GREENYELLOW,          COLORHEX_GREENYELLOW},
            { COLOR_GREY,                 COLORHEX_GREY},
            { COLOR_HONEYDEW,             COLORHEX_HONEYDEW},
            { COLOR_HOTPINK,              COLORHEX_HOTPINK},
            { COLOR_INDIANRED,            COLORHEX_INDIANRED},
            { COLOR_INDIGO,               COLORHEX_INDIGO},
            { COLOR_IVORY,                COLORHEX_IVORY},
            { COLOR_KHAKI,                COLORHEX_KHAKI},
            { COLOR_LAVENDER,             COLORHEX_LAVENDER},
            { COLOR_LAVENDERBLUSH,        COLORHEX_LAVENDERBLUSH},
            { COLOR_LAWNGREEN,            COLORHEX_LAWNGREEN},
            { COLOR_LEMONCHIFFON,         COLORHEX_LEMONCHIFFON},
            { COLOR_LIGHTBLUE,            COLORHEX_LIGHTBLUE},
            { COLOR_LIGHTCORAL,           COLORHEX_LIGHTCORAL},
            { COLOR_LIGHTCYAN,            COLORHEX_LIGHTCYAN},
            { COLOR_LIGHTGOLDENRODYELLOW, COLORHEX_LIGHTGOLDENRODYELLOW},
            { COLOR_LIGHTGRAY,            COLORHEX_LIGHTGRAY},
            { COLOR_LIGHTGREEN,           COLORHEX_LIGHTGREEN},
            { COLOR_LIGHTGREY,            COLORHEX_LIGHTGREY},
            { COLOR_LIGHTPINK,            COLORHEX_LIGHTPINK},
            { COLOR_LIGHTSALMON,          COLORHEX_LIGHTSALMON},
            { COLOR_LIGHTSEAGREEN,        COLORHEX_LIGHTSEAGREEN},
            { COLOR_LIGHTSKYBLUE,         COLORHEX_LIGHTSKYBLUE},
            { COLOR_LIGHTSLATEGRAY,       COLORHEX_LIGHTSLATEGRAY},
            { COLOR_LIGHTSLATEGREY,       COLORHEX_LIGHTSLATEGREY},
            { COLOR_LIGHTSTEELBLUE,       COLORHEX_LIGHTSTEELBLUE},
            { COLOR_LIGHTYELLOW,          COLORHEX_LIGHTYELLOW},
            { COLOR_LIME,                 COLORHEX_LIME},
            { COLOR_LIMEGREEN,            COLORHEX_LIMEGREEN},
            { COLOR_LINEN,                COLORHEX_LINEN},
            { COLOR_MAGENTA,              COLORHEX_MAGENTA},
            { COLOR_MAROON,               COLORHEX_MAROON},
            { COLOR_MEDIUMAQUAMARINE,     COLORHEX_MEDIUMAQUAMARINE},
            { COLOR_MEDIUMBLUE,           COLORHEX_MEDIUMBLUE},
            { COLOR_MEDIUMORCHID,         COLORHEX_MEDIUMORCHID},
            { COLOR_MEDIUMPURPLE,         COLORHEX_MEDIUMPURPLE},
            { COLOR_MEDIUMSEAGREEN,       COLORHEX_MEDIUMSEAGREEN},
            { COLOR_MEDIUMSLATEBLUE,      COLORHEX_MEDIUMSLATEBLUE},
            { COLOR_MEDIUMSPRINGGREEN,    COLORHEX_MEDIUMSPRINGGREEN},
            { COLOR_MEDIUMTURQUOISE,      COLORHEX_MEDIUMTURQUOISE},
            { COLOR_MEDIUMVIOLETRED,      COLORHEX_MEDIUMVIOLETRED},
            { COLOR_MIDNIGHTBLUE,         COLORHEX_MIDNIGHTBLUE},
            { COLOR_MINTCREAM,            COLORHEX_MINTCREAM},
            { COLOR_MISTYROSE,            COLORHEX_MISTYROSE},
            { COLOR_MOCCASIN,             COLORHEX_MOCCASIN},
            { COLOR_NAVAJOWHITE,          COLORHEX_NAVAJOWHITE},
            { COLOR_NAVY,                 COLORHEX_NAVY},
            { COLOR_OLDLACE,              COLORHEX_OLDLACE},
            { COLOR_OLIVE,                COLORHEX_OLIVE},
            { COLOR_OLIVEDRAB,            COLORHEX_OLIVEDRAB},
            { COLOR_ORANGE,               COLORHEX_ORANGE},
            { COLOR_ORANGERED,            COLORHEX_ORANGERED},
            { COLOR_ORCHID,               COLORHEX_ORCHID},
            { COLOR_PALEGOLDENROD,        COLORHEX_PALEGOLDENROD},
            { COLOR_PALEGREEN,            COLORHEX_PALEGREEN},
            { COLOR_PALETURQUOISE,        COLORHEX_PALETURQUOISE},
            { COLOR_PALEVIOLETRED,        COLORHEX_PALEVIOLETRED},
            { COLOR_PAPAYAWHIP,           COLORHEX_PAPAYAWHIP},
            { COLOR_PEACHPUFF,            COLORHEX_PEACHPUFF},
            { COLOR_PERU,                 COLORHEX_PERU},
            { COLOR_PINK,                 COLORHEX_PINK},
            { COLOR_PLUM,                 COLORHEX_PLUM},
            { COLOR_POWDERBLUE,           COLORHEX_POWDERBLUE},
            { COLOR_PURPLE,               COLORHEX_PURPLE},
            { COLOR_RED,                  COLORHEX_RED},
            { COLOR_ROSYBROWN,            COLORHEX_ROSYBROWN},
            { COLOR_ROYALBLUE,            COLORHEX_ROYALBLUE},
            { COLOR_SADDLEBROWN,          COLORHEX_SADDLEBROWN},
            { COLOR_SALMON,               COLORHEX_SALMON},
            { COLOR_SANDYBROWN,           COLORHEX_SANDYBROWN},
            { COLOR_SEAGREEN,             COLORHEX_SEAGREEN},
            { COLOR_SEASHELL,             COLORHEX_SEASHELL},
            { COLOR_SIENNA,               COLORHEX_SIENNA},
            { COLOR_SILVER,               COLORHEX_SILVER},
            { COLOR_SKYBLUE,              COLORHEX_SKYBLUE},
            { COLOR_SLATEBLUE,            COLORHEX_SLATEBLUE},
            { COLOR_SLATEGRAY,            COLORHEX_SLATEGRAY},
            { COLOR_SLATEGREY,            COLORHEX_SLATEGREY},
            { COLOR_SNOW,                 COLORHEX_SNOW},
            { COLOR_SPRINGGREEN,          COLORHEX_SPRINGGREEN},
            { COLOR_STEELBLUE,            COLORHEX_STEELBLUE},
            { COLOR_TAN,                  COLORHEX_TAN},
            { COLOR_TEAL,                 COLORHEX_TEAL},
            { COLOR_THISTLE,              COLORHEX_THISTLE},
            { COLOR_TOMATO,               COLORHEX_TOMATO},
            { COLOR_TURQUOISE,            COLORHEX_TURQUOISE},
            { COLOR_VIOLET,               COLORHEX_VIOLET},
            { COLOR_WHEAT,                COLORHEX_WHEAT},
            { COLOR_WHITE,                COLORHEX_WHITE},
            { COLOR_WHITESMOKE,           COLORHEX_WHITESMOKE},
            { COLOR_YELLOW,               COLORHEX_YELLOW},
            { COLOR_YELLOWGREEN,          COLORHEX_YELLOWGREEN},
            { COLOR_TRANSPARENT,          COLORHEX_TRANSPARENT},
        };
        return table;
    }

    std::unordered_map<std::string_view, uint32_t>& colorCodeLookup()
    {
        static std::unordered_map<std::string_view, uint32_t> name_lookup( colorTable().cbegin(),
                                                                           colorTable().cend());
        return name_lookup;
    }

    bool validName( std::string_view name)
    {
        auto& code_lookup = colorCodeLookup();
        return code_lookup.find( Util::toLower( name)) != code_lookup.cend();
    }

    std::string nameToHex( std::string_view name)
    {
        auto& code_lookup = colorCodeLookup();
        auto pos = code_lookup.find( Util::toLower( name));
        if( pos == code_lookup.cend())
            throw InvalidName( name);

        return HexCodec::fromBytes( HexCodec::unpack( pos->second), true, false);
    }

    Rgba nameToBytes( std::string_view name)
    {
        return HexCodec::toBytes( nameToHex( name));
    }

    std::vector<std::string> suggestNames( std::string_view name, int threshold)
    {
        return Util::findWordMatch( nameTree(), Util::toLower( name), threshold);
    }

    std::string_view closestName( const Rgba& rgba)
    {
        double initial = INFINITY;
        auto *nmatch = Util::approximate( colorTree(), { rgba[ 0], rgba[ 1], rgba[ 2]}, initial);
        return colorTable()[ nmatch->index].first;
    }
}
