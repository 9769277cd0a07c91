#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include "AbStatsException.h"

namespace abstats
{
  /**
   * @class GroupSummary
   * @brief (count, estimate, variance-of-estimate) triple describing one arm
   *        of an experiment.
   *
   * For proportions the estimate is successes / n and the variance is
   * p(1-p)/n. For means the estimate is the sample mean and the variance is
   * s²/n. Everything downstream of the two tests (delta-method intervals, the
   * minimum-sample-size solver) consumes only this triple.
   */
  class GroupSummary
  {
  public:
    GroupSummary(std::uint64_t count, double estimate, double variance)
      : mCount(count),
        mEstimate(estimate),
        mVariance(variance)
    {
      if (count < 1)
        throw ValidationError("GroupSummary: count must be at least 1");

      if (!std::isfinite(estimate) || !std::isfinite(variance) || variance < 0.0)
        throw ValidationError("GroupSummary: estimate and variance must be finite, variance non-negative");
    }

    /**
     * @brief Bernoulli summary of an arm with `successes` out of `n`.
     *        Uses the arm's own observed proportion (unpooled).
     */
    static GroupSummary fromProportion(std::uint64_t n, std::uint64_t successes)
    {
      if (n == 0)
        throw ValidationError("GroupSummary::fromProportion: n must be positive");

      if (successes > n)
        throw ValidationError("GroupSummary::fromProportion: successes ("
                              + std::to_string(successes) + ") exceed n ("
                              + std::to_string(n) + ")");

      const double p = static_cast<double>(successes) / static_cast<double>(n);
      return GroupSummary(n, p, p * (1.0 - p) / static_cast<double>(n));
    }

    /**
     * @brief Summary of the sample mean from n observations with unbiased
     *        sample variance s².
     */
    static GroupSummary fromSampleMean(std::uint64_t n, double mean, double sampleVariance)
    {
      if (n < 2)
        throw ValidationError("GroupSummary::fromSampleMean: at least 2 observations are required");

      return GroupSummary(n, mean, sampleVariance / static_cast<double>(n));
    }

    std::uint64_t getCount() const
    {
      return mCount;
    }

    double getEstimate() const
    {
      return mEstimate;
    }

    // Variance of the estimator, not of a single observation
    double getVariance() const
    {
      return mVariance;
    }

    // variance * n, i.e. the variance of one observation
    double getPerObservationVariance() const
    {
      return mVariance * static_cast<double>(mCount);
    }

  private:
    std::uint64_t mCount;
    double mEstimate;
    double mVariance;
  };

  /**
   * @struct SampleMoments
   * @brief Count, sum, mean and unbiased (n-1) variance of a sample.
   */
  struct SampleMoments
  {
    std::size_t count = 0;
    double sum = 0.0;
    double mean = 0.0;
    double variance = 0.0;
  };

  /**
   * @brief Single-pass, numerically stable mean and unbiased variance via
   *        Welford, accumulated in long double.
   *
   * NaN entries are treated as missing observations and skipped. Infinite
   * entries are rejected.
   *
   * @tparam Container Any iterable whose elements convert to double
   *                   (std::vector<double>, std::array<float, N>, std::list<int>, ...).
   *
   * @throws abstats::ValidationError on an infinite observation
   */
  template <typename Container>
  SampleMoments computeSampleMoments(const Container& data)
  {
    long double mean = 0.0L;
    long double m2   = 0.0L;
    long double sum  = 0.0L;
    std::size_t k = 0;

    for (const auto& value : data)
      {
	const double x = static_cast<double>(value);
	if (std::isnan(x))
	  continue;

	if (std::isinf(x))
	  throw ValidationError("computeSampleMoments: observations must be finite");

	++k;
	const long double xl = static_cast<long double>(x);
	sum += xl;
	const long double delta  = xl - mean;
	mean += delta / static_cast<long double>(k);
	const long double delta2 = xl - mean;
	m2 += delta * delta2;
      }

    SampleMoments moments;
    moments.count = k;
    moments.sum = static_cast<double>(sum);
    moments.mean = static_cast<double>(mean);
    moments.variance = (k < 2) ? 0.0 : static_cast<double>(m2 / static_cast<long double>(k - 1));
    return moments;
  }

} // namespace abstats
