// AbTestsTest.cpp
//
// End-to-end tests of the two public entry points, proportionsZTest and
// welchTTest, including the best-effort handling of undefined fields.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <cstring>
#include <deque>
#include <vector>
#include "AbStatsException.h"
#include "AbTests.h"

using Catch::Approx;
using namespace abstats;

namespace
{
  const std::vector<double> kControl = {10.1, 9.8, 11.2, 10.5, 9.9, 10.8, 10.3, 11.0, 9.7, 10.4, 9.8, 10.1};
  const std::vector<double> kTreatment = {11.0, 10.5, 11.8, 10.9, 11.2, 10.5, 10.7, 10.1, 10.3, 10.8};

  bool sameBits(double a, double b)
  {
    return std::memcmp(&a, &b, sizeof(double)) == 0;
  }
}

TEST_CASE("proportionsZTest: end-to-end reference example", "[AbTests][proportion]")
{
    const AbTestResult r = proportionsZTest(998, 101, 1001, 122, 0.05, 0.8);

    REQUIRE(r.kind == AbTestKind::ProportionZTest);
    REQUIRE(r.metricFormula == "122/1001");
    REQUIRE(r.metricValue == Approx(0.121878).margin(1e-6));
    REQUIRE(r.statistic == Approx(1.47).margin(0.005));
    REQUIRE(r.pValue == Approx(0.1418).margin(0.001));
    REQUIRE_FALSE(r.df.has_value());

    REQUIRE(r.deltaAbsolute == Approx(0.02067571706850263).margin(1e-12));
    REQUIRE(r.deltaRelative.has_value());
    REQUIRE(*r.deltaRelative == Approx(20.43006498452042).margin(1e-9));

    REQUIRE(r.ciAbsolute.lower == Approx(-0.0069076).margin(1e-6));
    REQUIRE(r.ciAbsolute.upper == Approx(0.0482590).margin(1e-6));
    REQUIRE(r.ciRelative.has_value());
    REQUIRE(r.ciRelative->lower == Approx(-9.5168).margin(1e-3));
    REQUIRE(r.ciRelative->upper == Approx(50.3769).margin(1e-3));

    REQUIRE(r.mssPosthoc.has_value());
    REQUIRE(r.mssPosthoc->requiredN == 3641);
    REQUIRE(r.mssPosthoc->actualRatio == Approx(0.27492447129909365));

    REQUIRE(r.criticalValue == Approx(1.959963984540054).margin(1e-8));
}

TEST_CASE("welchTTest: end-to-end reference example", "[AbTests][mean]")
{
    const AbTestResult r = welchTTest(kControl, kTreatment, 0.05, 0.8);

    REQUIRE(r.kind == AbTestKind::WelchTTest);
    REQUIRE(r.metricFormula == "107/10");
    REQUIRE(r.metricValue == Approx(10.78).margin(1e-12));
    REQUIRE(r.statistic == Approx(2.28).margin(0.005));
    REQUIRE(r.df.has_value());
    REQUIRE(*r.df == Approx(19.41).margin(0.005));
    REQUIRE(r.pValue == Approx(0.0338).margin(0.001));

    // Intervals use t_{0.975, df} rather than z
    REQUIRE(r.criticalValue == Approx(2.0900700705855693).margin(1e-7));
    REQUIRE(r.ciAbsolute.lower == Approx(0.04064818657349728).margin(1e-7));
    REQUIRE(r.ciAbsolute.upper == Approx(0.9193518134265).margin(1e-7));
    REQUIRE(*r.deltaRelative == Approx(4.660194174757269).margin(1e-9));
    REQUIRE(r.ciRelative->lower == Approx(0.3014989294601055).margin(1e-5));
    REQUIRE(r.ciRelative->upper == Approx(9.018889420054432).margin(1e-5));

    REQUIRE(r.mssPosthoc->requiredN == 16);
    REQUIRE(r.mssPosthoc->actualRatio == Approx(10.0 / 16.0));
}

TEST_CASE("welchTTest: metric formula for large and negative totals", "[AbTests][mean]")
{
    const std::vector<double> small = {1.0, 2.0, 3.0};

    SECTION("Total beyond the 64-bit integer range")
    {
        const AbTestResult r = welchTTest(small, std::vector<double>{1e19, 2e19, 3e19});
        REQUIRE(r.metricFormula == "60000000000000000000/3");
    }

    SECTION("Negative total is truncated toward zero")
    {
        REQUIRE(welchTTest(small, std::vector<double>{-1.5, -0.2, 0.4}).metricFormula == "-1/3");
        REQUIRE(welchTTest(small, std::vector<double>{-0.3, 0.1, -0.1}).metricFormula == "0/3");
    }
}

TEST_CASE("AbTests: absolute interval contains the absolute delta", "[AbTests][coverage]")
{
    SECTION("Proportions")
    {
        for (int ts = 0; ts <= 100; ts += 5)
        {
            const AbTestResult r = proportionsZTest(100, 40, 100, ts);
            REQUIRE(r.ciAbsolute.contains(r.deltaAbsolute));
        }
    }

    SECTION("Means")
    {
        const AbTestResult r = welchTTest(kControl, kTreatment);
        REQUIRE(r.ciAbsolute.contains(r.deltaAbsolute));
    }
}

TEST_CASE("AbTests: swapping control and treatment", "[AbTests][symmetry]")
{
    SECTION("Proportions")
    {
        const AbTestResult forward = proportionsZTest(998, 101, 1001, 122);
        const AbTestResult swapped = proportionsZTest(1001, 122, 998, 101);

        REQUIRE(swapped.deltaAbsolute == -forward.deltaAbsolute);
        REQUIRE(swapped.statistic == -forward.statistic);
        REQUIRE(swapped.pValue == forward.pValue);
        REQUIRE(*forward.deltaRelative > 0.0);
        REQUIRE(*swapped.deltaRelative < 0.0);
        // Denominator changes, so magnitudes differ
        REQUIRE(std::fabs(*swapped.deltaRelative) != Approx(std::fabs(*forward.deltaRelative)));
    }

    SECTION("Means")
    {
        const AbTestResult forward = welchTTest(kControl, kTreatment);
        const AbTestResult swapped = welchTTest(kTreatment, kControl);

        REQUIRE(swapped.deltaAbsolute == Approx(-forward.deltaAbsolute).margin(1e-12));
        REQUIRE(swapped.statistic == Approx(-forward.statistic).margin(1e-12));
        REQUIRE(swapped.pValue == Approx(forward.pValue).margin(1e-12));
        REQUIRE(*swapped.deltaRelative == Approx(-4.45269016697587).margin(1e-9));
        REQUIRE(swapped.metricFormula == "123/12");
    }
}

TEST_CASE("AbTests: zero control rate keeps the absolute fields", "[AbTests][partial]")
{
    const AbTestResult r = proportionsZTest(1000, 0, 1000, 10);

    REQUIRE_FALSE(r.deltaRelative.has_value());
    REQUIRE_FALSE(r.ciRelative.has_value());

    REQUIRE(r.deltaAbsolute == Approx(0.01));
    REQUIRE(r.ciAbsolute.contains(r.deltaAbsolute));
    REQUIRE(r.statistic == Approx(3.178208630818641).margin(1e-9));
    REQUIRE(r.pValue == Approx(0.0014818807747203908).margin(1e-9));
    REQUIRE(r.mssPosthoc.has_value());
    REQUIRE(r.mssPosthoc->requiredN == 778);
}

TEST_CASE("AbTests: identical rates", "[AbTests][partial]")
{
    const AbTestResult r = proportionsZTest(1000, 100, 1000, 100);

    REQUIRE(r.statistic == 0.0);
    REQUIRE(r.pValue == 1.0);
    REQUIRE(*r.deltaRelative == 0.0);
    REQUIRE_FALSE(r.mssPosthoc.has_value());
}

TEST_CASE("AbTests: allocation ratio override", "[AbTests][allocation]")
{
    const AbTestResult observed = proportionsZTest(2000, 200, 1000, 120);
    const AbTestResult balanced = proportionsZTest(2000, 200, 1000, 120, AbTestOptions(0.05, 0.8, 1.0));

    REQUIRE(observed.mssPosthoc->requiredN < balanced.mssPosthoc->requiredN);
}

TEST_CASE("AbTests: repeated calls are bit-identical", "[AbTests][idempotence]")
{
    const AbTestResult a = welchTTest(kControl, kTreatment);
    const AbTestResult b = welchTTest(kControl, kTreatment);

    REQUIRE(a.metricFormula == b.metricFormula);
    REQUIRE(sameBits(a.metricValue, b.metricValue));
    REQUIRE(sameBits(a.statistic, b.statistic));
    REQUIRE(sameBits(*a.df, *b.df));
    REQUIRE(sameBits(a.pValue, b.pValue));
    REQUIRE(sameBits(a.ciAbsolute.lower, b.ciAbsolute.lower));
    REQUIRE(sameBits(a.ciRelative->upper, b.ciRelative->upper));
    REQUIRE(a.mssPosthoc->requiredN == b.mssPosthoc->requiredN);

    const AbTestResult c = proportionsZTest(998, 101, 1001, 122);
    const AbTestResult d = proportionsZTest(998, 101, 1001, 122);
    REQUIRE(sameBits(c.pValue, d.pValue));
    REQUIRE(sameBits(c.ciRelative->lower, d.ciRelative->lower));
}

TEST_CASE("AbTests: containers other than vector", "[AbTests][containers]")
{
    const std::deque<double> control(kControl.begin(), kControl.end());
    const AbTestResult r = welchTTest(control, kTreatment);
    REQUIRE(r.statistic == Approx(2.2834402936836864).margin(1e-9));
}

TEST_CASE("AbTests: boundary validation", "[AbTests][errors]")
{
    SECTION("alpha and power must lie in (0, 1)")
    {
        REQUIRE_THROWS_AS(proportionsZTest(100, 10, 100, 12, 0.0, 0.8), ValidationError);
        REQUIRE_THROWS_AS(proportionsZTest(100, 10, 100, 12, 0.05, 1.0), ValidationError);
        REQUIRE_THROWS_AS(welchTTest(kControl, kTreatment, 1.2, 0.8), ValidationError);
    }

    SECTION("Counts")
    {
        REQUIRE_THROWS_AS(proportionsZTest(0, 0, 100, 12), ValidationError);
        REQUIRE_THROWS_AS(proportionsZTest(100, 120, 100, 12), ValidationError);
    }

    SECTION("Samples")
    {
        REQUIRE_THROWS_AS(welchTTest(std::vector<double>{1.0}, kTreatment), ValidationError);
        REQUIRE_THROWS_AS(welchTTest(std::vector<double>{1.0, 1.0}, kTreatment), DegenerateVarianceError);
    }
}
