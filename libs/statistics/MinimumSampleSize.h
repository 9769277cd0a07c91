#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include "AbStatsException.h"
#include "AbTestOptions.h"
#include "GroupSummary.h"
#include "NormalDistribution.h"
#include "StatisticalTypes.h"

namespace abstats
{
  /**
   * @class MinimumSampleSizeSolver
   * @brief Post-hoc minimum sample size: the treatment-arm size at which the
   *        effect actually observed would be detected at the configured
   *        alpha and power.
   *
   * With k = n_control / n_treatment the variance of the difference is
   * (σ_c²/k + σ_t²) / n_t, which gives the closed form
   *
   *     n_t = ⌈ (z_{1-α/2} + z_{power})² · (σ_c²/k + σ_t²) / Δ² ⌉
   *
   * σ² are per-observation variances (GroupSummary::getPerObservationVariance).
   * This is a diagnostic of an experiment already run, not a sizing tool.
   */
  class MinimumSampleSizeSolver
  {
  public:
    /**
     * @brief Required treatment-arm size, rounded up.
     *
     * @throws abstats::UndefinedMssError if Δ is zero, the combined variance
     *         is zero, or the result does not fit a 64-bit count
     * @throws abstats::ValidationError on a non-positive allocation ratio
     */
    static std::uint64_t requiredTreatmentSize(double deltaAbsolute,
					       double controlVariance,
					       double treatmentVariance,
					       double alpha,
					       double power,
					       double controlToTreatmentRatio)
    {
      if (!(controlToTreatmentRatio > 0.0) || !std::isfinite(controlToTreatmentRatio))
	throw ValidationError("MinimumSampleSizeSolver: allocation ratio must be positive and finite");

      if (!std::isfinite(deltaAbsolute) || deltaAbsolute == 0.0)
	throw UndefinedMssError("MinimumSampleSizeSolver: observed effect is zero, required sample size is unbounded");

      const double varianceTerm = controlVariance / controlToTreatmentRatio + treatmentVariance;
      if (!(varianceTerm > 0.0))
	throw UndefinedMssError("MinimumSampleSizeSolver: both arms have zero variance");

      const double zAlpha = NormalDistribution::twoSidedCriticalValue(alpha);
      const double zPower = NormalDistribution::powerQuantile(power);
      // A negative sum means the effect is detectable at any size
      const double zSum = std::max(0.0, zAlpha + zPower);

      const double nRequired = zSum * zSum * varianceTerm / (deltaAbsolute * deltaAbsolute);

      if (!std::isfinite(nRequired) ||
	  nRequired >= static_cast<double>(std::numeric_limits<std::int64_t>::max()))
	throw UndefinedMssError("MinimumSampleSizeSolver: required sample size is not representable");

      // At least one observation; a huge effect can push the quotient below 1
      const double rounded = std::ceil(nRequired);
      return rounded < 1.0 ? 1 : static_cast<std::uint64_t>(rounded);
    }

    /**
     * @brief Required size and the ratio of the observed treatment size to it.
     *
     * The allocation ratio comes from options when set, otherwise from the
     * observed counts of the two arms.
     *
     * @throws abstats::UndefinedMssError as for requiredTreatmentSize
     */
    static MssOutcome solve(const GroupSummary& control,
			    const GroupSummary& treatment,
			    const AbTestOptions& options)
    {
      const double k = options.getControlToTreatmentRatio()
	? *options.getControlToTreatmentRatio()
	: static_cast<double>(control.getCount()) / static_cast<double>(treatment.getCount());

      MssOutcome outcome;
      outcome.requiredN = requiredTreatmentSize(treatment.getEstimate() - control.getEstimate(),
						control.getPerObservationVariance(),
						treatment.getPerObservationVariance(),
						options.getAlpha(),
						options.getPower(),
						k);
      outcome.actualRatio = static_cast<double>(treatment.getCount())
	/ static_cast<double>(outcome.requiredN);
      return outcome;
    }

    /**
     * @brief Same as solve but reports "not computable" as an empty optional.
     */
    static std::optional<MssOutcome> trySolve(const GroupSummary& control,
					      const GroupSummary& treatment,
					      const AbTestOptions& options)
    {
      try
	{
	  return solve(control, treatment, options);
	}
      catch (const UndefinedMssError&)
	{
	  return std::nullopt;
	}
    }
  };

} // namespace abstats
