#pragma once

#include <ostream>
#include "AbTestConfiguration.h"
#include "AbTestResult.h"

namespace abstats
{
namespace cli
{

/**
 * @brief Process exit codes of the abstats executable
 */
enum ExitCode
{
    kExitSuccess = 0,
    kExitInvalidInput = 1,      ///< validation, configuration or input file errors
    kExitNumericalFailure = 2,  ///< degenerate variance, domain or convergence errors
    kExitUnexpectedError = 3    ///< any other std::exception
};

/**
 * @brief Runs one configured comparison and writes the result row
 */
class AbTestApplication
{
public:
    explicit AbTestApplication(const AbTestConfiguration& config);

    /**
     * @brief Computes the result without any I/O besides reading the
     *        observation files of the mean command
     */
    AbTestResult compute() const;

    /**
     * @brief compute() plus rendering and logging. Errors are reported on
     *        err and mapped to an ExitCode; nothing is thrown.
     */
    int run(std::ostream& out, std::ostream& err) const;

private:
    void logSummary(std::ostream& log, const AbTestResult& result) const;

    const AbTestConfiguration& mConfig;
};

} // namespace cli
} // namespace abstats
