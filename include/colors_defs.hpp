/***************************************************************************/
/*                                                                         */
/*  colors_defs.hpp                                                        */
/*                                                                         */
/*    CSS color keywords and their RGBA codes                              */
/*                                                                         */
/*  Copyright 2022 by Adesina Meekness                                     */
/*                                                                         */
/*                                                                         */
/*       ##    ## ##                                                       */
/*       ##    ##  #                                                       */
/*       ###  ###  #  ##                                                   */
/*       # # # ##  # #                                                     */
/* ####  # ### ##  ###                                                     */
/*       #  #  ##  # ##                                                    */
/*       #  #  ##  #  ##                                                   */
/*                                                                         */
/*                                                                         */
/*  This file is part of the Chromatic project, and may only be used,      */
/*  modified, and distributed under the terms of the GNU project           */
/*  license, LICENSE.TXT.  By continuing to use, modify, or distribute     */
/*  this file you indicate that you have read the license and              */
/*  understand and accept it fully.                                        */
/*                                                                         */
/***************************************************************************/

#ifndef CHROMATIC_COLORS_DEFS_HPP
#define CHROMATIC_COLORS_DEFS_HPP

/*
 * Keywords of CSS Color Module Level 3 ( https://www.w3.org/TR/css-color-3/)
 * plus `transparent`. Codes are packed as 0xRRGGBBAA.
 */

#define COLOR_ALICEBLUE             "aliceblue"
#define COLOR_ANTIQUEWHITE          "antiquewhite"
#define COLOR_AQUA                  "aqua"
#define COLOR_AQUAMARINE            "aquamarine"
#define COLOR_AZURE                 "azure"
#define COLOR_BEIGE                 "beige"
#define COLOR_BISQUE                "bisque"
#define COLOR_BLACK                 "black"
#define COLOR_BLANCHEDALMOND        "blanchedalmond"
#define COLOR_BLUE                  "blue"
#define COLOR_BLUEVIOLET            "blueviolet"
#define COLOR_BROWN                 "brown"
#define COLOR_BURLYWOOD             "burlywood"
#define COLOR_CADETBLUE             "cadetblue"
#define COLOR_CHARTREUSE            "chartreuse"
#define COLOR_CHOCOLATE             "chocolate"
#define COLOR_CORAL                 "coral"
#define COLOR_CORNFLOWERBLUE        "cornflowerblue"
#define COLOR_CORNSILK              "cornsilk"
#define COLOR_CRIMSON               "crimson"
#define COLOR_CYAN                  "cyan"
#define COLOR_DARKBLUE              "darkblue"
#define COLOR_DARKCYAN              "darkcyan"
#define COLOR_DARKGOLDENROD         "darkgoldenrod"
#define COLOR_DARKGRAY              "darkgray"
#define COLOR_DARKGREEN             "darkgreen"
#define COLOR_DARKGREY              "darkgrey"
#define COLOR_DARKKHAKI             "darkkhaki"
#define COLOR_DARKMAGENTA           "darkmagenta"
#define COLOR_DARKOLIVEGREEN        "darkolivegreen"
#define COLOR_DARKORANGE            "darkorange"
#define COLOR_DARKORCHID            "darkorchid"
#define COLOR_DARKRED               "darkred"
#define COLOR_DARKSALMON            "darksalmon"
#define COLOR_DARKSEAGREEN          "darkseagreen"
#define COLOR_DARKSLATEBLUE         "darkslateblue"
#define COLOR_DARKSLATEGRAY         "darkslategray"
#define COLOR_DARKSLATEGREY         "darkslategrey"
#define COLOR_DARKTURQUOISE         "darkturquoise"
#define COLOR_DARKVIOLET            "darkviolet"
#define COLOR_DEEPPINK              "deeppink"
#define COLOR_DEEPSKYBLUE           "deepskyblue"
#define COLOR_DIMGRAY               "dimgray"
#define COLOR_DIMGREY               "dimgrey"
#define COLOR_DODGERBLUE            "dodgerblue"
#define COLOR_FIREBRICK             "firebrick"
#define COLOR_FLORALWHITE           "floralwhite"
#define COLOR_FORESTGREEN           "forestgreen"
#define COLOR_FUCHSIA               "fuchsia"
#define COLOR_GAINSBORO             "gainsboro"
#define COLOR_GHOSTWHITE            "ghostwhite"
#define COLOR_GOLD                  "gold"
#define COLOR_GOLDENROD             "goldenrod"
#define COLOR_GRAY                  "gray"
#define COLOR_GREEN                 "green"
#define COLOR_GREENYELLOW           "greenyellow"
#define COLOR_GREY                  "grey"
#define COLOR_HONEYDEW              "honeydew"
#define COLOR_HOTPINK               "hotpink"
#define COLOR_INDIANRED             "indianred"
#define COLOR_INDIGO                "indigo"
#define COLOR_IVORY                 "ivory"
#define COLOR_KHAKI                 "khaki"
#define COLOR_LAVENDER              "lavender"
#define COLOR_LAVENDERBLUSH         "lavenderblush"
#define COLOR_LAWNGREEN             "lawngreen"
#define COLOR_LEMONCHIFFON          "lemonchiffon"
#define COLOR_LIGHTBLUE             "lightblue"
#define COLOR_LIGHTCORAL            "lightcoral"
#define COLOR_LIGHTCYAN             "lightcyan"
#define COLOR_LIGHTGOLDENRODYELLOW  "lightgoldenrodyellow"
#define COLOR_LIGHTGRAY             "lightgray"
#define COLOR_LIGHTGREEN            "lightgreen"
#define COLOR_LIGHTGREY             "lightgrey"
#define COLOR_LIGHTPINK             "lightpink"
#define COLOR_LIGHTSALMON           "lightsalmon"
#define COLOR_LIGHTSEAGREEN         "lightseagreen"
#define COLOR_LIGHTSKYBLUE          "lightskyblue"
#define COLOR_LIGHTSLATEGRAY        "lightslategray"
#define COLOR_LIGHTSLATEGREY        "lightslategrey"
#define COLOR_LIGHTSTEELBLUE        "lightsteelblue"
#define COLOR_LIGHTYELLOW           "lightyellow"
#define COLOR_LIME                  "lime"
#define COLOR_LIMEGREEN             "limegreen"
#define COLOR_LINEN                 "linen"
#define COLOR_MAGENTA               "magenta"
#define COLOR_MAROON                "maroon"
#define COLOR_MEDIUMAQUAMARINE      "mediumaquamarine"
#define COLOR_MEDIUMBLUE            "mediumblue"
#define COLOR_MEDIUMORCHID          "mediumorchid"
#define COLOR_MEDIUMPURPLE          "mediumpurple"
#define COLOR_MEDIUMSEAGREEN        "mediumseagreen"
#define COLOR_MEDIUMSLATEBLUE       "mediumslateblue"
#define COLOR_MEDIUMSPRINGGREEN     "mediumspringgreen"
#define COLOR_MEDIUMTURQUOISE       "mediumturquoise"
#define COLOR_MEDIUMVIOLETRED       "mediumvioletred"
#define COLOR_MIDNIGHTBLUE          "midnightblue"
#define COLOR_MINTCREAM             "mintcream"
#define COLOR_MISTYROSE             "mistyrose"
#define COLOR_MOCCASIN              "moccasin"
#define COLOR_NAVAJOWHITE           "navajowhite"
#define COLOR_NAVY                  "navy"
#define COLOR_OLDLACE               "oldlace"
#define COLOR_OLIVE                 "olive"
#define COLOR_OLIVEDRAB             "olivedrab"
#define COLOR_ORANGE                "orange"
#define COLOR_ORANGERED             "orangered"
#define COLOR_ORCHID                "orchid"
#define COLOR_PALEGOLDENROD         "palegoldenrod"
#define COLOR_PALEGREEN             "palegreen"
#define COLOR_PALETURQUOISE         "paleturquoise"
#define COLOR_PALEVIOLETRED         "palevioletred"
#define COLOR_PAPAYAWHIP            "papayawhip"
#define COLOR_PEACHPUFF             "peachpuff"
#define COLOR_PERU                  "peru"
#define COLOR_PINK                  "pink"
#define COLOR_PLUM                  "plum"
#define COLOR_POWDERBLUE            "powderblue"
#define COLOR_PURPLE                "purple"
#define COLOR_RED                   "red"
#define COLOR_ROSYBROWN             "rosybrown"
#define COLOR_ROYALBLUE             "royalblue"
#define COLOR_SADDLEBROWN           "saddlebrown"
#define COLOR_SALMON                "salmon"
#define COLOR_SANDYBROWN            "sandybrown"
#define COLOR_SEAGREEN              "seagreen"
#define COLOR_SEASHELL              "seashell"
#define COLOR_SIENNA                "sienna"
#define COLOR_SILVER                "silver"
#define COLOR_SKYBLUE               "skyblue"
#define COLOR_SLATEBLUE             "slateblue"
#define COLOR_SLATEGRAY             "slategray"
#define COLOR_SLATEGREY             "slategrey"
#define COLOR_SNOW                  "snow"
#define COLOR_SPRINGGREEN           "springgreen"
#define COLOR_STEELBLUE             "steelblue"
#define COLOR_TAN                   "tan"
#define COLOR_TEAL                  "teal"
#define COLOR_THISTLE               "thistle"
#define COLOR_TOMATO                "tomato"
#define COLOR_TURQUOISE             "turquoise"
#define COLOR_VIOLET                "violet"
#define COLOR_WHEAT                 "wheat"
#define COLOR_WHITE                 "white"
#define COLOR_WHITESMOKE            "whitesmoke"
#define COLOR_YELLOW                "yellow"
#define COLOR_YELLOWGREEN           "yellowgreen"
#define COLOR_TRANSPARENT           "transparent"

#define COLORHEX_ALICEBLUE             0xF0F8FFFFU
#define COLORHEX_ANTIQUEWHITE          0xFAEBD7FFU
#define COLORHEX_AQUA                  0x00FFFFFFU
#define COLORHEX_AQUAMARINE            0x7FFFD4FFU
#define COLORHEX_AZURE                 0xF0FFFFFFU
#define COLORHEX_BEIGE                 0xF5F5DCFFU
#define COLORHEX_BISQUE                0xFFE4C4FFU
#define COLORHEX_BLACK                 0x000000FFU
#define COLORHEX_BLANCHEDALMOND        0xFFEBCDFFU
#define COLORHEX_BLUE                  0x0000FFFFU
#define COLORHEX_BLUEVIOLET            0x8A2BE2FFU
#define COLORHEX_BROWN                 0xA52A2AFFU
#define COLORHEX_BURLYWOOD             0xDEB887FFU
#define COLORHEX_CADETBLUE             0x5F9EA0FFU
#define COLORHEX_CHARTREUSE            0x7FFF00FFU
#define COLORHEX_CHOCOLATE             0xD2691EFFU
#define COLORHEX_CORAL                 0xFF7F50FFU
#define COLORHEX_CORNFLOWERBLUE        0x6495EDFFU
#define COLORHEX_CORNSILK              0xFFF8DCFFU
#define COLORHEX_CRIMSON               0xDC143CFFU
#define COLORHEX_CYAN                  0x00FFFFFFU
#define COLORHEX_DARKBLUE              0x00008BFFU
#define COLORHEX_DARKCYAN              0x008B8BFFU
#define COLORHEX_DARKGOLDENROD         0xB8860BFFU
#define COLORHEX_DARKGRAY              0xA9A9A9FFU
#define COLORHEX_DARKGREEN             0x006400FFU
#define COLORHEX_DARKGREY              0xA9A9A9FFU
#define COLORHEX_DARKKHAKI             0xBDB76BFFU
#define COLORHEX_DARKMAGENTA           0x8B008BFFU
#define COLORHEX_DARKOLIVEGREEN        0x556B2FFFU
#define COLORHEX_DARKORANGE            0xFF8C00FFU
#define COLORHEX_DARKORCHID            0x9932CCFFU
#define COLORHEX_DARKRED               0x8B0000FFU
#define COLORHEX_DARKSALMON            0xE9967AFFU
#define COLORHEX_DARKSEAGREEN          0x8FBC8FFFU
#define COLORHEX_DARKSLATEBLUE         0x483D8BFFU
#define COLORHEX_DARKSLATEGRAY         0x2F4F4FFFU
#define COLORHEX_DARKSLATEGREY         0x2F4F4FFFU
#define COLORHEX_DARKTURQUOISE         0x00CED1FFU
#define COLORHEX_DARKVIOLET            0x9400D3FFU
#define COLORHEX_DEEPPINK              0xFF1493FFU
#define COLORHEX_DEEPSKYBLUE           0x00BFFFFFU
#define COLORHEX_DIMGRAY               0x696969FFU
#define COLORHEX_DIMGREY               0x696969FFU
#define COLORHEX_DODGERBLUE            0x1E90FFFFU
#define COLORHEX_FIREBRICK             0xB22222FFU
#define COLORHEX_FLORALWHITE           0xFFFAF0FFU
#define COLORHEX_FORESTGREEN           0x228B22FFU
#define COLORHEX_FUCHSIA               0xFF00FFFFU
#define COLORHEX_GAINSBORO             0xDCDCDCFFU
#define COLORHEX_GHOSTWHITE            0xF8F8FFFFU
#define COLORHEX_GOLD                  0xFFD700FFU
#define COLORHEX_GOLDENROD             0xDAA520FFU
#define COLORHEX_GRAY                  0x808080FFU
#define COLORHEX_GREEN                 0x008000FFU
#define COLORHEX_GREENYELLOW           0xADFF2FFFU
#define COLORHEX_GREY                  0x808080FFU
#define COLORHEX_HONEYDEW              0xF0FFF0FFU
#define COLORHEX_HOTPINK               0xFF69B4FFU
#define COLORHEX_INDIANRED             0xCD5C5CFFU
#define COLORHEX_INDIGO                0x4B0082FFU
#define COLORHEX_IVORY                 0xFFFFF0FFU
#define COLORHEX_KHAKI                 0xF0E68CFFU
#define COLORHEX_LAVENDER              0xE6E6FAFFU
#define COLORHEX_LAVENDERBLUSH         0xFFF0F5FFU
#define COLORHEX_LAWNGREEN             0x7CFC00FFU
#define COLORHEX_LEMONCHIFFON          0xFFFACDFFU
#define COLORHEX_LIGHTBLUE             0xADD8E6FFU
#define COLORHEX_LIGHTCORAL            0xF08080FFU
#define COLORHEX_LIGHTCYAN             0xE0FFFFFFU
#define COLORHEX_LIGHTGOLDENRODYELLOW  0xFAFAD2FFU
#define COLORHEX_LIGHTGRAY             0xD3D3D3FFU
#define COLORHEX_LIGHTGREEN            0x90EE90FFU
#define COLORHEX_LIGHTGREY             0xD3D3D3FFU
#define COLORHEX_LIGHTPINK             0xFFB6C1FFU
#define COLORHEX_LIGHTSALMON           0xFFA07AFFU
#define COLORHEX_LIGHTSEAGREEN         0x20B2AAFFU
#define COLORHEX_LIGHTSKYBLUE          0x87CEFAFFU
#define COLORHEX_LIGHTSLATEGRAY        0x778899FFU
#define COLORHEX_LIGHTSLATEGREY        0x778899FFU
#define COLORHEX_LIGHTSTEELBLUE        0xB0C4DEFFU
#define COLORHEX_LIGHTYELLOW           0xFFFFE0FFU
#define COLORHEX_LIME                  0x00FF00FFU
#define COLORHEX_LIMEGREEN             0x32CD32FFU
#define COLORHEX_LINEN                 0xFAF0E6FFU
#define COLORHEX_MAGENTA               0xFF00FFFFU
#define COLORHEX_MAROON                0x800000FFU
#define COLORHEX_MEDIUMAQUAMARINE      0x66CDAAFFU
#define COLORHEX_MEDIUMBLUE            0x0000CDFFU
#define COLORHEX_MEDIUMORCHID          0xBA55D3FFU
#define COLORHEX_MEDIUMPURPLE          0x9370DBFFU
#define COLORHEX_MEDIUMSEAGREEN        0x3CB371FFU
#define COLORHEX_MEDIUMSLATEBLUE       0x7B68EEFFU
#define COLORHEX_MEDIUMSPRINGGREEN     0x00FA9AFFU
#define COLORHEX_MEDIUMTURQUOISE       0x48D1CCFFU
#define COLORHEX_MEDIUMVIOLETRED       0xC71585FFU
#define COLORHEX_MIDNIGHTBLUE          0x191970FFU
#define COLORHEX_MINTCREAM             0xF5FFFAFFU
#define COLORHEX_MISTYROSE             0xFFE4E1FFU
#define COLORHEX_MOCCASIN              0xFFE4B5FFU
#define COLORHEX_NAVAJOWHITE           0xFFDEADFFU
#define COLORHEX_NAVY                  0x000080FFU
#define COLORHEX_OLDLACE               0xFDF5E6FFU
#define COLORHEX_OLIVE                 0x808000FFU
#define COLORHEX_OLIVEDRAB             0x6B8E23FFU
#define COLORHEX_ORANGE                0xFFA500FFU
#define COLORHEX_ORANGERED             0xFF4500FFU
#define COLORHEX_ORCHID                0xDA70D6FFU
#define COLORHEX_PALEGOLDENROD         0xEEE8AAFFU
#define COLORHEX_PALEGREEN             0x98FB98FFU
#define COLORHEX_PALETURQUOISE         0xAFEEEEFFU
#define COLORHEX_PALEVIOLETRED         0xDB7093FFU
#define COLORHEX_PAPAYAWHIP            0xFFEFD5FFU
#define COLORHEX_PEACHPUFF             0xFFDAB9FFU
#define COLORHEX_PERU                  0xCD853FFFU
#define COLORHEX_PINK                  0xFFC0CBFFU
#define COLORHEX_PLUM                  0xDDA0DDFFU
#define COLORHEX_POWDERBLUE            0xB0E0E6FFU
#define COLORHEX_PURPLE                0x800080FFU
#define COLORHEX_RED                   0xFF0000FFU
#define COLORHEX_ROSYBROWN             0xBC8F8FFFU
#define COLORHEX_ROYALBLUE             0x4169E1FFU
#define COLORHEX_SADDLEBROWN           0x8B4513FFU
#define COLORHEX_SALMON                0xFA8072FFU
#define COLORHEX_SANDYBROWN            0xF4A460FFU
#define COLORHEX_SEAGREEN              0x2E8B57FFU
#define COLORHEX_SEASHELL              0xFFF5EEFFU
#define COLORHEX_SIENNA                0xA0522DFFU
#define COLORHEX_SILVER                0xC0C0C0FFU
#define COLORHEX_SKYBLUE               0x87CEEBFFU
#define COLORHEX_SLATEBLUE             0x6A5ACDFFU
#define COLORHEX_SLATEGRAY             0x708090FFU
#define COLORHEX_SLATEGREY             0x708090FFU
#define COLORHEX_SNOW                  0xFFFAFAFFU
#define COLORHEX_SPRINGGREEN           0x00FF7FFFU
#define COLORHEX_STEELBLUE             0x4682B4FFU
#define COLORHEX_TAN                   0xD2B48CFFU
#define COLORHEX_TEAL                  0x008080FFU
#define COLORHEX_THISTLE               0xD8BFD8FFU
#define COLORHEX_TOMATO                0xFF6347FFU
#define COLORHEX_TURQUOISE             0x40E0D0FFU
#define COLORHEX_VIOLET                0xEE82EEFFU
#define COLORHEX_WHEAT                 0xF5DEB3FFU
#define COLORHEX_WHITE                 0xFFFFFFFFU
#define COLORHEX_WHITESMOKE            0xF5F5F5FFU
#define COLORHEX_YELLOW                0xFFFF00FFU
#define COLORHEX_YELLOWGREEN           0x9ACD32FFU
#define COLORHEX_TRANSPARENT           0x00000000U

#define COLOR_COUNT                    148

#endif //CHROMATIC_COLORS_DEFS_HPP
