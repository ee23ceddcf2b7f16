#include "utils/accessibility.hpp"
#include "CppUTest/TestHarness.h"

TEST_GROUP(AccessibilityTests)
{
};

TEST( AccessibilityTests, GammaEndpoints)
{
    DOUBLES_EQUAL( 0., Accessibility::gamma( 0), 1e-12);
    DOUBLES_EQUAL( 1., Accessibility::gamma( 255), 1e-12);
    // 10/255 sits below the linear threshold.
    DOUBLES_EQUAL( 10. / 255 / 12.92, Accessibility::gamma( 10), 1e-12);
}

TEST( AccessibilityTests, RelativeLuminance)
{
    DOUBLES_EQUAL( 0., Accessibility::relativeLuminance( 0, 0, 0), 1e-12);
    DOUBLES_EQUAL( 1., Accessibility::relativeLuminance( 255, 255, 255), 1e-12);
    DOUBLES_EQUAL( .2126, Accessibility::relativeLuminance( 255, 0, 0), 1e-12);
    DOUBLES_EQUAL( .7152, Accessibility::relativeLuminance( 0, 255, 0), 1e-12);
    DOUBLES_EQUAL( .0722, Accessibility::relativeLuminance( 0, 0, 255), 1e-12);
}

TEST( AccessibilityTests, PerceivedLightness)
{
    DOUBLES_EQUAL( 0., Accessibility::perceivedLightness( 0.), 1e-12);
    DOUBLES_EQUAL( 1., Accessibility::perceivedLightness( 1.), 1e-9);
    DOUBLES_EQUAL( .4949, Accessibility::perceivedLightness( .18), 1e-3);
    DOUBLES_EQUAL( .005 * 9.033, Accessibility::perceivedLightness( .005), 1e-12);
}

TEST( AccessibilityTests, ContrastRatio)
{
    DOUBLES_EQUAL( 21., Accessibility::contrastRatio( 1., 0.), 1e-12);
    DOUBLES_EQUAL( 21., Accessibility::contrastRatio( 0., 1.), 1e-12);
    DOUBLES_EQUAL( 1., Accessibility::contrastRatio( .3, .3), 1e-12);
}

TEST( AccessibilityTests, MinimumContrast)
{
    DOUBLES_EQUAL( 4.5, Accessibility::minimumContrast( Accessibility::Level::AA), 1e-12);
    DOUBLES_EQUAL( 3., Accessibility::minimumContrast( Accessibility::Level::AA, true), 1e-12);
    DOUBLES_EQUAL( 7., Accessibility::minimumContrast( Accessibility::Level::AAA), 1e-12);
    DOUBLES_EQUAL( 4.5, Accessibility::minimumContrast( Accessibility::Level::AAA, true), 1e-12);
}
