#pragma once

#include <cstdint>
#include <optional>

namespace abstats
{

/**
 * @brief Test statistic and two-sided p-value of a two-sample test
 *
 * df is present only for the Welch t-test.
 */
struct TestResult
{
    double statistic = 0.0;
    double pValue = 1.0;
    std::optional<double> df;
};

/**
 * @brief Treatment-vs-control change. relative is a fraction, (T - C) / C.
 */
struct UpliftEstimate
{
    double absolute = 0.0;
    double relative = 0.0;
};

struct ConfidenceInterval
{
    double lower = 0.0;
    double upper = 0.0;

    bool contains(double value) const
    {
        return lower <= value && value <= upper;
    }
};

/**
 * @brief Post-hoc minimum sample size for the treatment arm
 */
struct MssOutcome
{
    std::uint64_t requiredN = 0;
    double actualRatio = 0.0;   ///< observed treatment n / requiredN
};

/**
 * @brief Which test produced a result; selects the formula layout
 */
enum class AbTestKind
{
    ProportionZTest,
    WelchTTest
};

} // namespace abstats
