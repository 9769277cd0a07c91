#ifndef __ABSTATS_EXCEPTION_H
#define __ABSTATS_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace abstats
{
  // Base class for every failure raised by the A/B statistics library
  class AbStatsException : public std::runtime_error
  {
  public:
    AbStatsException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~AbStatsException() = default;
  };

  // Malformed or out-of-range input: counts, alpha/power, sequence length
  class ValidationError : public AbStatsException
  {
  public:
    explicit ValidationError(const std::string& msg)
      : AbStatsException(msg) {}
  };

  // A sample with zero variance makes a ratio in the t-test undefined
  class DegenerateVarianceError : public AbStatsException
  {
  public:
    explicit DegenerateVarianceError(const std::string& msg)
      : AbStatsException(msg) {}
  };

  // Zero observed effect; the required sample size is unbounded
  class UndefinedMssError : public AbStatsException
  {
  public:
    explicit UndefinedMssError(const std::string& msg)
      : AbStatsException(msg) {}
  };

  // A bounded iterative numeric routine did not converge
  class ConvergenceError : public AbStatsException
  {
  public:
    explicit ConvergenceError(const std::string& msg)
      : AbStatsException(msg) {}
  };

  class ConfigurationError : public AbStatsException
  {
  public:
    explicit ConfigurationError(const std::string& msg)
      : AbStatsException(msg) {}
  };

  class InputFileError : public AbStatsException
  {
  public:
    explicit InputFileError(const std::string& msg)
      : AbStatsException(msg) {}
  };

  // Argument outside the mathematical domain of a function, e.g. a quantile
  // requested at p = 0 or a relative change against a zero baseline.
  class DomainError : public std::domain_error
  {
  public:
    explicit DomainError(const std::string& msg)
      : std::domain_error(msg) {}
  };

} // namespace abstats

#endif // __ABSTATS_EXCEPTION_H
