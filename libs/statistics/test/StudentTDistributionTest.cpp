// StudentTDistributionTest.cpp
//
// Unit tests for abstats::StudentTDistribution (Boost.Math backed CDF,
// two-sided p-value and quantile for real-valued degrees of freedom).

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "AbStatsException.h"
#include "NormalDistribution.h"
#include "StudentTDistribution.h"

using Catch::Approx;
using namespace abstats;

TEST_CASE("StudentTDistribution::cdf: known values", "[StudentT][cdf]")
{
    SECTION("Centre of the distribution")
    {
        REQUIRE(StudentTDistribution::cdf(0.0, 7.3) == Approx(0.5).margin(1e-15));
    }

    SECTION("df = 5")
    {
        REQUIRE(StudentTDistribution::cdf(1.0, 5.0) == Approx(0.818391266175438).margin(1e-10));
    }

    SECTION("Symmetry")
    {
        const double df = 19.405;
        REQUIRE(StudentTDistribution::cdf(-1.3, df)
                == Approx(1.0 - StudentTDistribution::cdf(1.3, df)).margin(1e-14));
    }
}

TEST_CASE("StudentTDistribution::twoSidedPValue", "[StudentT][pvalue]")
{
    SECTION("Integer df")
    {
        REQUIRE(StudentTDistribution::twoSidedPValue(2.0, 10.0) == Approx(0.07338803477074045).margin(1e-10));
    }

    SECTION("Welch-Satterthwaite df from the reference mean example")
    {
        REQUIRE(StudentTDistribution::twoSidedPValue(2.2834402936836864, 19.405181921715467)
                == Approx(0.03383216280333055).margin(1e-8));
    }

    SECTION("Zero statistic gives 1, sign is irrelevant")
    {
        REQUIRE(StudentTDistribution::twoSidedPValue(0.0, 4.0) == Approx(1.0).margin(1e-15));
        REQUIRE(StudentTDistribution::twoSidedPValue(-2.5, 8.0)
                == StudentTDistribution::twoSidedPValue(2.5, 8.0));
    }

    SECTION("Infinite statistic gives 0")
    {
        REQUIRE(StudentTDistribution::twoSidedPValue(std::numeric_limits<double>::infinity(), 3.0) == 0.0);
    }

    SECTION("Heavier tails than the normal")
    {
        REQUIRE(StudentTDistribution::twoSidedPValue(2.0, 5.0) > NormalDistribution::twoSidedPValue(2.0));
    }

    SECTION("Approaches the normal for large df")
    {
        REQUIRE(StudentTDistribution::twoSidedPValue(1.96, 1e7)
                == Approx(NormalDistribution::twoSidedPValue(1.96)).margin(1e-6));
    }
}

TEST_CASE("StudentTDistribution::quantile and critical values", "[StudentT][quantile]")
{
    SECTION("t_{0.975, 10}")
    {
        REQUIRE(StudentTDistribution::twoSidedCriticalValue(0.05, 10.0) == Approx(2.2281388519862757).margin(1e-9));
        REQUIRE(StudentTDistribution::quantile(0.975, 10.0) == Approx(2.2281388519862757).margin(1e-9));
    }

    SECTION("Non-integer df")
    {
        REQUIRE(StudentTDistribution::twoSidedCriticalValue(0.05, 19.405181921715467)
                == Approx(2.0900700705855693).margin(1e-8));
    }

    SECTION("Quantile inverts the CDF")
    {
        const double df = 6.4;
        for (double p : {0.01, 0.1, 0.5, 0.9, 0.99})
        {
            REQUIRE(StudentTDistribution::cdf(StudentTDistribution::quantile(p, df), df)
                    == Approx(p).margin(1e-10));
        }
    }

    SECTION("Probability outside (0, 1) is a domain error")
    {
        REQUIRE_THROWS_AS(StudentTDistribution::quantile(0.0, 5.0), DomainError);
        REQUIRE_THROWS_AS(StudentTDistribution::quantile(1.0, 5.0), DomainError);
        REQUIRE_THROWS_AS(StudentTDistribution::twoSidedCriticalValue(1.0, 5.0), DomainError);
    }
}

TEST_CASE("StudentTDistribution: invalid degrees of freedom", "[StudentT][errors]")
{
    REQUIRE_THROWS_AS(StudentTDistribution::cdf(1.0, 0.0), ValidationError);
    REQUIRE_THROWS_AS(StudentTDistribution::cdf(1.0, -2.0), ValidationError);
    REQUIRE_THROWS_AS(StudentTDistribution::twoSidedPValue(1.0, std::numeric_limits<double>::quiet_NaN()),
                      ValidationError);
    REQUIRE_THROWS_AS(StudentTDistribution::quantile(0.5, std::numeric_limits<double>::infinity()),
                      ValidationError);
}

TEST_CASE("StudentTDistribution: Boost errors are translated the same way everywhere", "[StudentT][errors]")
{
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE_THROWS_AS(StudentTDistribution::cdf(nan, 10.0), DomainError);
    REQUIRE_THROWS_AS(StudentTDistribution::twoSidedPValue(nan, 10.0), DomainError);

    REQUIRE_THROWS_AS(detail::evaluate_student_t("overflow", []() -> double {
                          throw std::overflow_error("too large");
                      }), ConvergenceError);
    REQUIRE_THROWS_AS(detail::evaluate_student_t("evaluation", []() -> double {
                          throw boost::math::evaluation_error("no convergence");
                      }), ConvergenceError);
    REQUIRE_THROWS_AS(detail::evaluate_student_t("domain", []() -> double {
                          throw std::domain_error("bad argument");
                      }), DomainError);
    REQUIRE(detail::evaluate_student_t("ok", []() { return 0.5; }) == 0.5);
}

TEST_CASE("StudentTDistribution: iteration bound is part of the policy", "[StudentT][policy]")
{
    REQUIRE(detail::kStudentTMaxRootIterations == 100);
    REQUIRE(boost::math::policies::get_max_root_iterations<detail::StudentTPolicy>() == 100);
}
