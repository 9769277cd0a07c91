#pragma once

#include <cmath>
#include <optional>
#include "AbStatsException.h"
#include "GroupSummary.h"
#include "StatisticalTypes.h"

namespace abstats
{
  /**
   * @brief Absolute and relative treatment effect with their intervals.
   *
   * Relative quantities are in percent and are empty when the control
   * estimate is zero.
   */
  struct DeltaMethodResult
  {
    double deltaAbsolute = 0.0;
    ConfidenceInterval ciAbsolute;
    std::optional<double> deltaRelativePercent;
    std::optional<ConfidenceInterval> ciRelativePercent;
  };

  /**
   * @class DeltaMethodInterval
   * @brief Confidence intervals for the difference T - C and for the uplift
   *        (T - C) / C from two independent GroupSummary estimates.
   *
   * The absolute interval is Δ ± c·sqrt(V_c + V_t). The uplift is a ratio
   * r = μ_t/μ_c - 1 so its variance is propagated to first order:
   *
   *     Var(r) ≈ V_t / μ_c² + μ_t² · V_c / μ_c⁴
   *
   * where the second term comes from ∂r/∂μ_c = -μ_t/μ_c². Both intervals
   * share the same critical value c (z for the proportion test, t_df for the
   * Welch test), which the caller supplies.
   */
  class DeltaMethodInterval
  {
  public:
    static UpliftEstimate computeUplift(const GroupSummary& control, const GroupSummary& treatment)
    {
      requireNonZeroBaseline(control);

      UpliftEstimate uplift;
      uplift.absolute = treatment.getEstimate() - control.getEstimate();
      uplift.relative = uplift.absolute / control.getEstimate();
      return uplift;
    }

    static double standardError(const GroupSummary& control, const GroupSummary& treatment)
    {
      return std::sqrt(control.getVariance() + treatment.getVariance());
    }

    static ConfidenceInterval absoluteInterval(const GroupSummary& control,
					       const GroupSummary& treatment,
					       double criticalValue)
    {
      const double delta = treatment.getEstimate() - control.getEstimate();
      const double halfWidth = criticalValue * standardError(control, treatment);
      return ConfidenceInterval{delta - halfWidth, delta + halfWidth};
    }

    /**
     * @brief First-order variance of the fractional uplift (T - C) / C.
     *
     * @throws abstats::DomainError if the control estimate is zero
     */
    static double relativeVariance(const GroupSummary& control, const GroupSummary& treatment)
    {
      requireNonZeroBaseline(control);

      const double muC = control.getEstimate();
      const double muT = treatment.getEstimate();
      const double muC2 = muC * muC;

      return treatment.getVariance() / muC2
	+ (muT * muT) * control.getVariance() / (muC2 * muC2);
    }

    /**
     * @brief Interval for the uplift expressed in percent.
     *
     * @throws abstats::DomainError if the control estimate is zero
     */
    static ConfidenceInterval relativeIntervalPercent(const GroupSummary& control,
						      const GroupSummary& treatment,
						      double criticalValue)
    {
      const UpliftEstimate uplift = computeUplift(control, treatment);
      const double halfWidth = criticalValue * std::sqrt(relativeVariance(control, treatment));

      return ConfidenceInterval{(uplift.relative - halfWidth) * 100.0,
				(uplift.relative + halfWidth) * 100.0};
    }

    /**
     * @brief Computes both intervals. A zero control estimate leaves the
     *        relative fields empty; the absolute fields are always filled.
     */
    static DeltaMethodResult compute(const GroupSummary& control,
				     const GroupSummary& treatment,
				     double criticalValue)
    {
      DeltaMethodResult result;
      result.deltaAbsolute = treatment.getEstimate() - control.getEstimate();
      result.ciAbsolute = absoluteInterval(control, treatment, criticalValue);

      try
	{
	  result.deltaRelativePercent = computeUplift(control, treatment).relative * 100.0;
	  result.ciRelativePercent = relativeIntervalPercent(control, treatment, criticalValue);
	}
      catch (const DomainError&)
	{
	  result.deltaRelativePercent.reset();
	  result.ciRelativePercent.reset();
	}

      return result;
    }

  private:
    static void requireNonZeroBaseline(const GroupSummary& control)
    {
      if (control.getEstimate() == 0.0)
	throw DomainError("DeltaMethodInterval: relative change is undefined for a zero control estimate");
    }
  };

} // namespace abstats
