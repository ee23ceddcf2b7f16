/***************************************************************************/
/*                                                                         */
/*  chromatic.hpp                                                          */
/*                                                                         */
/*    Forward declaration                                                  */
/*                                                                         */
/*  Copyright 2022 by                                                      */
/*  Adesina Meekness                                                       */
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

#ifndef CHROMATIC_HPP
#define CHROMATIC_HPP

#include "config.h"
#include <array>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#define ACCESSIBLE( ptr)               (( ptr) != nullptr)
#define RED( color)                    (( uint8_t)(( color) >> 24u))
#define GREEN( color)                  (( uint8_t)((( color) >> 16u) & 0xFFu))
#define BLUE( color)                   (( uint8_t)((( color) >> 8u) & 0xFFu))
#define ALPHA( color)                  (( uint8_t)(( color) & 0xFFu))
#define RGBA( red, green, blue, alpha) (((( uint32_t)(( uint8_t)red))  << 24u) |\
                                       ((( uint32_t)(( uint8_t)green)) << 16u) |\
                                       ((( uint32_t)(( uint8_t)blue))  << 8u) | (( uint8_t)alpha))
#define RGB_SCALE                      255
#define DEG_MAX                        360
#define DEG_SECTOR                     60
#define PERCENT                        100
#define HEX_DIGITS                     8
#define ENUM_CAST( idx)                ( static_cast<uint8_t>( idx))
#define DOUBLE_CAST( value)            ( static_cast<double>( value))
#define INT_CAST( value)               ( static_cast<int>( value))

/*
 * Longest keyword is 20 characters, every edit distance between two
 * keywords stays strictly below this bound.
 */
#define MAX_DIFF_TOLERANCE             24

/*
 * Library layout:
 * Component            -> canonical byte
 * HexCodec             -> 8 digit hex <-> Rgba
 * ColorUtil            -> keyword table, suggestions, nearest keyword
 * ColorSpaceConverter  -> RGB <-> HSL
 * Accessibility        -> WCAG luminance and contrast
 * Color                -> immutable value built on all of the above
 *
 * CommandLineParser -> ApplicationDirector -> ColorPrinter
 */

// Red, green, blue and alpha bytes, in that order.
using Rgba = std::array<uint8_t, 4>;

enum class Channel
{
    Red = 0,
    Green,
    Blue,
    Alpha
};

// Hue in degrees [0, 360), saturation and lightness in [0, 1].
struct HslColor
{
    double hue{}, saturation{}, lightness{};
};

/*
 *  Stores the keyword colors in a KDTree.
 *  KDTrees are used in searching in spatial domain for the closest
 *  match of a point to other set of points in space.
 */
struct KDNode
{
    std::array<uint8_t, 3> rgb{};
    size_t index = -1;
    std::shared_ptr<KDNode> left{}, right{};
    KDNode( std::array<uint8_t, 3> rgb, size_t index)
    : rgb( rgb), index( index)
    {
    }
};

/*
 *  Stores the closest words in a BKTree.
 *  The MAX_DIFF_TOLERANCE width indicates the closeness metric.
 *  BKTree:: Walter Austin Burkhard and Robert M. Keller
 * is an approximate word search data structure.
 */
struct BKNode
{
    std::string_view word;
    std::shared_ptr<BKNode> next[ MAX_DIFF_TOLERANCE]{};
    explicit BKNode( std::string_view word)
    : word( word)
    {
    }
};

enum class OutputFormat
{
    Hex,
    Rgb,
    Hsl,
    Info
};

/*
 * The single transformation applied to the first color given on the command line.
 */
enum class Operation
{
    None,
    Complement,
    Invert,
    Grayscale,
    Lighten,
    Darken,
    Mix,
    Average,
    Contrast,
    BestText
};

struct ApplicationDirector
{
    std::vector<std::string_view> colors;           // Positional arguments, in order.
    std::vector<std::string_view> unknown_options;
    std::vector<std::string_view> invalid_numbers;  // Long names of options whose value is not a number.
    std::string_view              mix_with,
                                  contrast_with,
                                  light_text{ DEFAULT_LIGHT_TEXT},
                                  dark_text{ DEFAULT_DARK_TEXT};
    double                        mix_ratio{ .5},
                                  amount{};         // Used by Lighten and Darken.
    Operation                     operation{ Operation::None};
    OutputFormat                  out_format{ OutputFormat::Hex};
    bool                          include_alpha{ true},
                                  include_hash{ true},
                                  upper_case{ false};
    bool                          list_colors{ false},
                                  show_help{ false},
                                  preview{ false},
                                  verbose{ false};
};

#endif //CHROMATIC_HPP
