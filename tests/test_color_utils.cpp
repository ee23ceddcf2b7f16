#include <algorithm>
#include "color_error.hpp"
#include "utils/color_utils.hpp"
#include "utils/utils.hpp"
#include "CppUTest/TestHarness.h"

TEST_GROUP(ColorUtilsTests)
{
};

TEST( ColorUtilsTests, TableHoldsEveryKeyword)
{
    LONGS_EQUAL( 148, ColorUtil::colorTable().size());
    LONGS_EQUAL( 148, ColorUtil::colorCodeLookup().size());
}

TEST( ColorUtilsTests, NamesAreCaseInsensitive)
{
    CHECK_FALSE( ColorUtil::validName( "RebeccaPurple"));
    CHECK( ColorUtil::validName( "Red"));
    CHECK( ColorUtil::validName( "LIGHTGOLDENRODYELLOW"));
    CHECK_FALSE( ColorUtil::validName( "notacolor"));
    CHECK_FALSE( ColorUtil::validName( ""));
}

TEST( ColorUtilsTests, NameToHex)
{
    STRCMP_EQUAL( "ff0000ff", ColorUtil::nameToHex( "red").c_str());
    STRCMP_EQUAL( "9370dbff", ColorUtil::nameToHex( "MediumPurple").c_str());
    STRCMP_EQUAL( "00000000", ColorUtil::nameToHex( "transparent").c_str());
    CHECK_THROWS( InvalidName, ColorUtil::nameToHex( "reed"));
}

TEST( ColorUtilsTests, NameToBytes)
{
    auto bytes = ColorUtil::nameToBytes( "cornflowerblue");
    LONGS_EQUAL( 0x64, bytes[ 0]);
    LONGS_EQUAL( 0x95, bytes[ 1]);
    LONGS_EQUAL( 0xed, bytes[ 2]);
    LONGS_EQUAL( 0xff, bytes[ 3]);
}

TEST( ColorUtilsTests, SuggestionsComeClosestFirst)
{
    // green and grey are one edit away, gray two.
    auto matches = ColorUtil::suggestNames( "gren");
    auto gray = std::find( matches.cbegin(), matches.cend(), "gray");
    CHECK( gray != matches.cend());
    CHECK( std::find( matches.cbegin(), gray, "green") != gray);
    CHECK( std::find( matches.cbegin(), gray, "grey") != gray);

    matches = ColorUtil::suggestNames( "Whte", 1);
    CHECK( std::find( matches.cbegin(), matches.cend(), "white") != matches.cend());

    CHECK( ColorUtil::suggestNames( "zzzzzzzzzzzzzzzz").empty());
}

TEST( ColorUtilsTests, ClosestNameExactMatches)
{
    STRCMP_EQUAL( "red", std::string( ColorUtil::closestName( { 255, 0, 0, 255})).c_str());
    STRCMP_EQUAL( "navy", std::string( ColorUtil::closestName( { 0, 0, 128, 255})).c_str());
    // aqua and cyan share a code, the first declared wins.
    STRCMP_EQUAL( "aqua", std::string( ColorUtil::closestName( { 0, 255, 255, 255})).c_str());
    STRCMP_EQUAL( "gray", std::string( ColorUtil::closestName( { 128, 128, 128, 255})).c_str());
}

TEST( ColorUtilsTests, ClosestNameIgnoresAlphaAndTransparent)
{
    STRCMP_EQUAL( "black", std::string( ColorUtil::closestName( { 0, 0, 0, 0})).c_str());
    STRCMP_EQUAL( "red", std::string( ColorUtil::closestName( { 254, 1, 0, 17})).c_str());
}

TEST( ColorUtilsTests, EditDistance)
{
    LONGS_EQUAL( 0, Util::editDistance( "gold", "gold"));
    LONGS_EQUAL( 1, Util::editDistance( "gren", "green"));
    LONGS_EQUAL( 3, Util::editDistance( "kitten", "sitting"));
    LONGS_EQUAL( 4, Util::editDistance( "", "teal"));
}

TEST( ColorUtilsTests, FormatNumber)
{
    STRCMP_EQUAL( "1", Util::formatNumber( 1.).c_str());
    STRCMP_EQUAL( "0.5", Util::formatNumber( .5).c_str());
    STRCMP_EQUAL( "100", Util::formatNumber( 100.).c_str());
}
