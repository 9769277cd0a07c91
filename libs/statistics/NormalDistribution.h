// Normal Distribution Utility Functions
// Standard normal CDF, quantile and the two-sided helpers used by the
// significance tests and the minimum-sample-size solver.

#pragma once

#include <algorithm>
#include <cmath>
#include "NormalQuantile.h"

namespace abstats
{
  /**
   * @struct NormalDistribution
   * @brief Utility functions for the standard normal distribution N(0,1).
   *
   * Thin facade over the kernels in NormalQuantile.h. The proportion z-test
   * takes its p-value from here and both tests take the MSS quantiles
   * z_{1-alpha/2} and z_{power} from here.
   */
  struct NormalDistribution
  {
    /**
     * @brief Φ(x) = P(Z ≤ x) where Z ~ N(0,1).
     */
    static inline double standardNormalCdf(double x) noexcept
    {
      return detail::compute_normal_cdf(x);
    }

    /**
     * @brief Φ⁻¹(p), the x such that Φ(x) = p.
     *
     * @throws abstats::DomainError if p is not in the open interval (0, 1)
     */
    static inline double standardNormalQuantile(double p)
    {
      return detail::compute_normal_quantile(p);
    }

    /**
     * @brief Two-sided critical value z_{1-alpha/2}.
     *
     * @example
     * double z = twoSidedCriticalValue(0.05);  // ~1.95996
     */
    static inline double twoSidedCriticalValue(double alpha)
    {
      return detail::compute_two_sided_critical_value(alpha);
    }

    /**
     * @brief z_{power} = Φ⁻¹(1 - beta) for a target power 1 - beta.
     */
    static inline double powerQuantile(double power)
    {
      return detail::compute_normal_quantile(power);
    }

    /**
     * @brief Two-sided p-value 2 * (1 - Φ(|z|)), clamped to [0, 1].
     *
     * An infinite statistic gives 0, a zero statistic gives exactly 1.
     */
    static inline double twoSidedPValue(double z) noexcept
    {
      const double p = 2.0 * detail::compute_normal_survival(std::fabs(z));
      return std::min(1.0, std::max(0.0, p));
    }
  };

} // namespace abstats
