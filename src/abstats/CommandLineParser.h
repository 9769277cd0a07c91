#pragma once

#include <optional>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "AbTestConfiguration.h"

namespace abstats
{
namespace cli
{

/**
 * @brief Result of parsing the command line
 *
 * Exactly one of: help requested, version requested, or a configuration.
 */
struct ParsedCommandLine
{
    bool helpRequested = false;
    bool versionRequested = false;
    std::optional<AbTestConfiguration> configuration;
    std::string usage;
};

/**
 * @brief Builds an AbTestConfiguration from argv and an optional INI-style
 *        config file (--config). Values given on the command line win over
 *        values from the file.
 */
class CommandLineParser
{
public:
    CommandLineParser();

    /**
     * @throws abstats::ConfigurationError on unknown options, malformed
     *         values, an unreadable config file or missing required input
     */
    ParsedCommandLine parse(int argc, const char* const argv[]) const;

    ParsedCommandLine parse(const std::vector<std::string>& args) const;

    std::string usage() const;

private:
    boost::program_options::options_description mGeneric;
    boost::program_options::options_description mSettings;
    boost::program_options::options_description mHidden;
    boost::program_options::positional_options_description mPositional;
};

} // namespace cli
} // namespace abstats
