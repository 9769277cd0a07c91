#pragma once

#include <optional>
#include <string>
#include "GroupSummary.h"
#include "StatisticalTypes.h"

namespace abstats
{
  /**
   * @struct AbTestResult
   * @brief One result row of an A/B comparison.
   *
   * Values are stored at full precision; rounding happens only when the row
   * is rendered (see ResultFormatter). Relative quantities are in percent.
   * Fields that are undefined for the data (relative change against a zero
   * control, MSS for a zero effect) are left empty rather than failing the
   * whole comparison.
   */
  struct AbTestResult
  {
    AbTestKind kind;
    std::string metricFormula;        ///< "<treatment successes or sum>/<treatment n>"
    double metricValue;               ///< treatment estimate
    std::optional<double> deltaRelative;
    double deltaAbsolute;
    double pValue;
    std::optional<ConfidenceInterval> ciRelative;
    ConfidenceInterval ciAbsolute;
    std::optional<MssOutcome> mssPosthoc;
    double statistic;
    std::optional<double> df;         ///< Welch t-test only
    double criticalValue;             ///< z or t used for both intervals

    GroupSummary control;
    GroupSummary treatment;
  };

} // namespace abstats
