#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "AbTestOptions.h"

namespace abstats
{
namespace cli
{

enum class AbCommand
{
    Proportion,
    Mean
};

enum class OutputFormat
{
    Table,
    Csv
};

/**
 * @brief Raw counts for the proportion test
 */
struct ProportionCounts
{
    std::int64_t controlN = 0;
    std::int64_t controlSuccess = 0;
    std::int64_t treatmentN = 0;
    std::int64_t treatmentSuccess = 0;
};

/**
 * @brief Effective settings of one abstats run, after the command line and
 *        the optional config file have been merged
 *
 * Throws abstats::ConfigurationError from the constructor when a setting is
 * out of range or the input required by the command is missing.
 */
class AbTestConfiguration
{
public:
    AbTestConfiguration(AbCommand command,
                        double alpha,
                        double power,
                        std::optional<double> allocationRatio,
                        OutputFormat format,
                        std::optional<ProportionCounts> counts,
                        std::string controlFile,
                        std::string treatmentFile,
                        std::string logFile,
                        bool verbose);

    AbCommand getCommand() const
    {
        return mCommand;
    }

    double getAlpha() const
    {
        return mAlpha;
    }

    double getPower() const
    {
        return mPower;
    }

    const std::optional<double>& getAllocationRatio() const
    {
        return mAllocationRatio;
    }

    OutputFormat getOutputFormat() const
    {
        return mFormat;
    }

    // Only valid for AbCommand::Proportion
    const ProportionCounts& getProportionCounts() const;

    const std::string& getControlFile() const
    {
        return mControlFile;
    }

    const std::string& getTreatmentFile() const
    {
        return mTreatmentFile;
    }

    const std::string& getLogFile() const
    {
        return mLogFile;
    }

    bool isVerbose() const
    {
        return mVerbose;
    }

    AbTestOptions toTestOptions() const
    {
        return AbTestOptions(mAlpha, mPower, mAllocationRatio);
    }

    static OutputFormat parseOutputFormat(const std::string& name);
    static AbCommand parseCommand(const std::string& name);
    static std::string commandName(AbCommand command);

private:
    AbCommand mCommand;
    double mAlpha;
    double mPower;
    std::optional<double> mAllocationRatio;
    OutputFormat mFormat;
    std::optional<ProportionCounts> mCounts;
    std::string mControlFile;
    std::string mTreatmentFile;
    std::string mLogFile;
    bool mVerbose;
};

} // namespace cli
} // namespace abstats
