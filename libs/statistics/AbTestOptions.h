#pragma once

#include <cmath>
#include <optional>
#include <string>
#include "AbStatsException.h"

namespace abstats
{
  /**
   * @class AbTestOptions
   * @brief Significance level, target power and MSS allocation ratio shared
   *        by both two-sample tests.
   *
   * The allocation ratio k = n_control / n_treatment is used by the
   * minimum-sample-size solver. When it is not set, the ratio of the counts
   * actually observed is used so that the required size describes the design
   * as it was run.
   */
  class AbTestOptions
  {
  public:
    static constexpr double kDefaultAlpha = 0.05;
    static constexpr double kDefaultPower = 0.8;

    explicit AbTestOptions(double alpha = kDefaultAlpha,
			   double power = kDefaultPower,
			   std::optional<double> controlToTreatmentRatio = std::nullopt)
      : mAlpha(alpha),
	mPower(power),
	mControlToTreatmentRatio(controlToTreatmentRatio)
    {
      if (!(alpha > 0.0 && alpha < 1.0))
	throw ValidationError("AbTestOptions: alpha must be in (0, 1), got " + std::to_string(alpha));

      if (!(power > 0.0 && power < 1.0))
	throw ValidationError("AbTestOptions: power must be in (0, 1), got " + std::to_string(power));

      if (controlToTreatmentRatio &&
	  (!(*controlToTreatmentRatio > 0.0) || !std::isfinite(*controlToTreatmentRatio)))
	throw ValidationError("AbTestOptions: allocation ratio must be positive and finite");
    }

    double getAlpha() const
    {
      return mAlpha;
    }

    double getPower() const
    {
      return mPower;
    }

    const std::optional<double>& getControlToTreatmentRatio() const
    {
      return mControlToTreatmentRatio;
    }

  private:
    double mAlpha;
    double mPower;
    std::optional<double> mControlToTreatmentRatio;
  };

} // namespace abstats
