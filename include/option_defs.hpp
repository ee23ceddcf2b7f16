/***************************************************************************/
/*                                                                         */
/*  option_defs.hpp                                                        */
/*                                                                         */
/*    Command line options and their help messages                         */
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

#ifndef CHROMATIC_OPTION_DEFS_HPP
#define CHROMATIC_OPTION_DEFS_HPP

#define SHORT( option)                 option##_SHORT
#define MESSAGE( option)               option##_MESSAGE
#define STRUCTURE_PREFIX( option)      "-" option##_SHORT ", --" option
#define LONG_PREFIX( option)           "    --" option

#define HELP_PROMPT                    "help"
#define HELP_PROMPT_SHORT              "h"
#define HELP_PROMPT_MESSAGE            "Print this help and exit."

#define LIST_COLORS                    "list-colors"
#define LIST_COLORS_SHORT              "l"
#define LIST_COLORS_MESSAGE            "List every CSS color keyword with its code."

#define AS_HEX                         "hex"
#define AS_HEX_SHORT                   "x"
#define AS_HEX_MESSAGE                 "Print the result in hex notation ( default)."

#define AS_RGB                         "rgb"
#define AS_RGB_SHORT                   "r"
#define AS_RGB_MESSAGE                 "Print the result as rgb(R G B / A)."

#define AS_HSL                         "hsl"
#define AS_HSL_SHORT                   "s"
#define AS_HSL_MESSAGE                 "Print the result as hsl(Hdeg S% L% / A)."

#define INFO                           "info"
#define INFO_SHORT                     "i"
#define INFO_MESSAGE                   "Print every representation, the luminance and the closest keyword."

#define NO_ALPHA                       "no-alpha"
#define NO_ALPHA_MESSAGE               "Leave the alpha digits out of hex output."

#define NO_HASH                        "no-hash"
#define NO_HASH_MESSAGE                "Leave the leading `#` out of hex output."

#define UPPER_CASE                     "upper"
#define UPPER_CASE_SHORT               "u"
#define UPPER_CASE_MESSAGE             "Print hex digits in upper case."

#define COMPLEMENT                     "complement"
#define COMPLEMENT_SHORT               "c"
#define COMPLEMENT_MESSAGE             "Rotate the hue by 180 degrees."

#define INVERT                         "invert"
#define INVERT_SHORT                   "n"
#define INVERT_MESSAGE                 "Invert the red, green and blue channels."

#define GRAYSCALE                      "grayscale"
#define GRAYSCALE_SHORT                "g"
#define GRAYSCALE_MESSAGE              "Drop the saturation to zero."

#define LIGHTEN                        "lighten"
#define LIGHTEN_MESSAGE                "Raise the lightness by the given amount in [0, 1]."

#define DARKEN                         "darken"
#define DARKEN_MESSAGE                 "Lower the lightness by the given amount in [0, 1]."

#define MIX                            "mix"
#define MIX_SHORT                      "m"
#define MIX_MESSAGE                    "Mix with the given color, see --ratio."

#define MIX_RATIO                      "ratio"
#define MIX_RATIO_MESSAGE              "Share of the --mix color in [0, 1], 0.5 by default."

#define AVERAGE                        "average"
#define AVERAGE_SHORT                  "a"
#define AVERAGE_MESSAGE                "Average every color given."

#define CONTRAST                       "contrast"
#define CONTRAST_SHORT                 "k"
#define CONTRAST_MESSAGE               "Print the WCAG contrast ratio against the given color."

#define BEST_TEXT                      "best-text"
#define BEST_TEXT_SHORT                "b"
#define BEST_TEXT_MESSAGE              "Pick the more readable text color on this background, see --light and --dark."

#define LIGHT_TEXT                     "light"
#define LIGHT_TEXT_MESSAGE             "Light text candidate for --best-text."

#define DARK_TEXT                      "dark"
#define DARK_TEXT_MESSAGE              "Dark text candidate for --best-text."

#define PREVIEW                        "preview"
#define PREVIEW_SHORT                  "p"
#define PREVIEW_MESSAGE                "Print a swatch of the result ( ignored when NO_COLOR is set)."

#define VERBOSE                        "verbose"
#define VERBOSE_SHORT                  "v"
#define VERBOSE_MESSAGE                "Trace every step on the standard log."

#define OPTIONS_COUNT                  23

#endif //CHROMATIC_OPTION_DEFS_HPP
