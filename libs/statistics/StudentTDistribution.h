#pragma once

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <boost/math/distributions/students_t.hpp>
#include <boost/math/policies/policy.hpp>
#include "AbStatsException.h"

namespace abstats
{
  namespace detail
  {
    // Upper bound on Halley/Newton iterations inside the incomplete-beta
    // inversion behind the t quantile.
    constexpr unsigned long kStudentTMaxRootIterations = 100;

    using StudentTPolicy = boost::math::policies::policy<
      boost::math::policies::max_root_iterations<kStudentTMaxRootIterations>,
      boost::math::policies::evaluation_error<boost::math::policies::throw_on_error>,
      boost::math::policies::domain_error<boost::math::policies::throw_on_error>,
      boost::math::policies::overflow_error<boost::math::policies::throw_on_error>>;

    using StudentTDist = boost::math::students_t_distribution<double, StudentTPolicy>;

    inline void validate_degrees_of_freedom(double df)
    {
      if (!(df > 0.0) || !std::isfinite(df))
        throw ValidationError("StudentTDistribution: degrees of freedom must be positive and finite, got "
                              + std::to_string(df));
    }

    // Runs a Boost.Math evaluation, translating the errors the policy raises
    template <typename Evaluation>
    double evaluate_student_t(const char* where, Evaluation evaluation)
    {
      try
	{
	  return evaluation();
	}
      catch (const boost::math::evaluation_error& e)
	{
	  throw ConvergenceError(std::string(where) + ": " + e.what());
	}
      catch (const std::overflow_error& e)
	{
	  throw ConvergenceError(std::string(where) + ": " + e.what());
	}
      catch (const std::domain_error& e)
	{
	  throw DomainError(std::string(where) + ": " + e.what());
	}
    }
  } // namespace detail

  /**
   * @struct StudentTDistribution
   * @brief Student-t CDF and quantile for a real-valued number of degrees of
   *        freedom (Welch-Satterthwaite df is generally not an integer).
   *
   * Evaluation is delegated to Boost.Math. Evaluation and overflow failures
   * inside Boost, including exhausting the root-iteration bound, are
   * reported as abstats::ConvergenceError; a NaN argument is reported as
   * abstats::DomainError.
   */
  struct StudentTDistribution
  {
    static double cdf(double t, double df)
    {
      detail::validate_degrees_of_freedom(df);

      return detail::evaluate_student_t("StudentTDistribution::cdf", [df, t]() {
        return boost::math::cdf(detail::StudentTDist(df), t);
      });
    }

    /**
     * @brief Two-sided p-value 2 * P(T > |t|).
     *
     * Uses the complemented CDF so that small p-values keep their relative
     * precision instead of cancelling against 1.
     */
    static double twoSidedPValue(double t, double df)
    {
      detail::validate_degrees_of_freedom(df);

      if (std::isinf(t))
        return 0.0;

      const double upper = detail::evaluate_student_t("StudentTDistribution::twoSidedPValue", [df, t]() {
        return boost::math::cdf(boost::math::complement(detail::StudentTDist(df), std::fabs(t)));
      });
      return std::min(1.0, std::max(0.0, 2.0 * upper));
    }

    /**
     * @brief Inverse CDF, the t with P(T ≤ t) = p.
     *
     * @throws abstats::DomainError if p is not in (0, 1)
     * @throws abstats::ConvergenceError if the root finder does not converge
     *         within kStudentTMaxRootIterations iterations
     */
    static double quantile(double p, double df)
    {
      if (!(p > 0.0 && p < 1.0))
        throw DomainError("StudentTDistribution::quantile: probability p must be in (0, 1)");

      detail::validate_degrees_of_freedom(df);

      return detail::evaluate_student_t("StudentTDistribution::quantile", [df, p]() {
        return boost::math::quantile(detail::StudentTDist(df), p);
      });
    }

    /**
     * @brief Two-sided critical value t_{1-alpha/2, df}.
     */
    static double twoSidedCriticalValue(double alpha, double df)
    {
      if (!(alpha > 0.0 && alpha < 1.0))
        throw DomainError("StudentTDistribution::twoSidedCriticalValue: alpha must be in (0, 1)");

      detail::validate_degrees_of_freedom(df);

      return detail::evaluate_student_t("StudentTDistribution::twoSidedCriticalValue", [df, alpha]() {
        return boost::math::quantile(boost::math::complement(detail::StudentTDist(df), alpha / 2.0));
      });
    }
  };

} // namespace abstats
