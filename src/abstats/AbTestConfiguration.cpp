#include "AbTestConfiguration.h"
#include <cmath>
#include <utility>
#include <boost/algorithm/string.hpp>
#include "AbStatsException.h"

namespace abstats
{
namespace cli
{

AbTestConfiguration::AbTestConfiguration(AbCommand command,
                                         double alpha,
                                         double power,
                                         std::optional<double> allocationRatio,
                                         OutputFormat format,
                                         std::optional<ProportionCounts> counts,
                                         std::string controlFile,
                                         std::string treatmentFile,
                                         std::string logFile,
                                         bool verbose)
    : mCommand(command),
      mAlpha(alpha),
      mPower(power),
      mAllocationRatio(allocationRatio),
      mFormat(format),
      mCounts(std::move(counts)),
      mControlFile(std::move(controlFile)),
      mTreatmentFile(std::move(treatmentFile)),
      mLogFile(std::move(logFile)),
      mVerbose(verbose)
{
    if (!(mAlpha > 0.0 && mAlpha < 1.0))
        throw ConfigurationError("alpha must be in (0, 1), got " + std::to_string(mAlpha));

    if (!(mPower > 0.0 && mPower < 1.0))
        throw ConfigurationError("power must be in (0, 1), got " + std::to_string(mPower));

    if (mAllocationRatio && (!(*mAllocationRatio > 0.0) || !std::isfinite(*mAllocationRatio)))
        throw ConfigurationError("allocation-ratio must be positive");

    if (mCommand == AbCommand::Proportion && !mCounts)
        throw ConfigurationError("proportion: --control-n, --control-success, --treatment-n and "
                                 "--treatment-success are required");

    if (mCommand == AbCommand::Mean && (mControlFile.empty() || mTreatmentFile.empty()))
        throw ConfigurationError("mean: --control-file and --treatment-file are required");
}

const ProportionCounts& AbTestConfiguration::getProportionCounts() const
{
    if (!mCounts)
        throw ConfigurationError("No proportion counts configured for command "
                                 + commandName(mCommand));
    return *mCounts;
}

OutputFormat AbTestConfiguration::parseOutputFormat(const std::string& name)
{
    if (boost::algorithm::iequals(name, "table"))
        return OutputFormat::Table;

    if (boost::algorithm::iequals(name, "csv"))
        return OutputFormat::Csv;

    throw ConfigurationError("Unknown output format '" + name + "' (expected table or csv)");
}

AbCommand AbTestConfiguration::parseCommand(const std::string& name)
{
    if (name == "proportion")
        return AbCommand::Proportion;

    if (name == "mean")
        return AbCommand::Mean;

    throw ConfigurationError("Unknown command '" + name + "' (expected proportion or mean)");
}

std::string AbTestConfiguration::commandName(AbCommand command)
{
    return command == AbCommand::Proportion ? "proportion" : "mean";
}

} // namespace cli
} // namespace abstats
