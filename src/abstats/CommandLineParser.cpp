#include "CommandLineParser.h"
#include <cstdint>
#include <fstream>
#include <sstream>
#include "AbStatsException.h"
#include "AbTestOptions.h"

namespace po = boost::program_options;

namespace abstats
{
namespace cli
{

CommandLineParser::CommandLineParser()
    : mGeneric("Generic options"),
      mSettings("Test settings (also accepted in the --config file)"),
      mHidden("Hidden options")
{
    mGeneric.add_options()
        ("help,h", "Show help message")
        ("version", "Show version")
        ("config,c", po::value<std::string>(), "INI-style configuration file")
        ("log-file", po::value<std::string>(), "Mirror log output to this file")
        ("verbose,v", "Log effective settings and per-arm summaries");

    mSettings.add_options()
        ("alpha", po::value<double>()->default_value(AbTestOptions::kDefaultAlpha), "Significance level in (0, 1)")
        ("power", po::value<double>()->default_value(AbTestOptions::kDefaultPower), "Target power in (0, 1)")
        ("allocation-ratio", po::value<double>(), "control/treatment size ratio for the post-hoc sample size "
                                                  "(default: observed ratio)")
        ("format,f", po::value<std::string>()->default_value("table"), "Output format: table or csv")
        ("control-n", po::value<std::int64_t>(), "Control observations (proportion)")
        ("control-success", po::value<std::int64_t>(), "Control successes (proportion)")
        ("treatment-n", po::value<std::int64_t>(), "Treatment observations (proportion)")
        ("treatment-success", po::value<std::int64_t>(), "Treatment successes (proportion)")
        ("control-file", po::value<std::string>(), "Control observations file (mean)")
        ("treatment-file", po::value<std::string>(), "Treatment observations file (mean)");

    mHidden.add_options()
        ("command", po::value<std::string>(), "proportion or mean");

    mPositional.add("command", 1);
}

std::string CommandLineParser::usage() const
{
    std::ostringstream os;
    os << "abstats - two-sample A/B test statistics\n\n";
    os << "Usage: abstats proportion --control-n N --control-success S --treatment-n N --treatment-success S [options]\n";
    os << "       abstats mean --control-file PATH --treatment-file PATH [options]\n\n";
    os << mGeneric << '\n' << mSettings << '\n';
    os << "Examples:\n";
    os << "  abstats proportion --control-n 998 --control-success 101 --treatment-n 1001 --treatment-success 122\n";
    os << "  abstats mean --control-file control.txt --treatment-file treatment.txt --alpha 0.01 --format csv\n";
    return os.str();
}

ParsedCommandLine CommandLineParser::parse(const std::vector<std::string>& args) const
{
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("abstats");
    for (const auto& a : args)
        argv.push_back(a.c_str());

    return parse(static_cast<int>(argv.size()), argv.data());
}

ParsedCommandLine CommandLineParser::parse(int argc, const char* const argv[]) const
{
    po::options_description all;
    all.add(mGeneric).add(mSettings).add(mHidden);

    ParsedCommandLine parsed;
    parsed.usage = usage();

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(mPositional).run(), vm);

        // store() keeps the first value seen, so the command line wins
        if (vm.count("config"))
        {
            const std::string configPath = vm["config"].as<std::string>();
            std::ifstream configStream(configPath);
            if (!configStream.is_open())
                throw ConfigurationError("Cannot open config file " + configPath);

            po::store(po::parse_config_file(configStream, mSettings), vm);
        }

        po::notify(vm);
    }
    catch (const po::error& e)
    {
        throw ConfigurationError(e.what());
    }

    if (vm.count("help"))
    {
        parsed.helpRequested = true;
        return parsed;
    }

    if (vm.count("version"))
    {
        parsed.versionRequested = true;
        return parsed;
    }

    if (!vm.count("command"))
        throw ConfigurationError("A command is required (proportion or mean)");

    const AbCommand command = AbTestConfiguration::parseCommand(vm["command"].as<std::string>());

    std::optional<ProportionCounts> counts;
    if (vm.count("control-n") && vm.count("control-success") &&
        vm.count("treatment-n") && vm.count("treatment-success"))
    {
        ProportionCounts c;
        c.controlN = vm["control-n"].as<std::int64_t>();
        c.controlSuccess = vm["control-success"].as<std::int64_t>();
        c.treatmentN = vm["treatment-n"].as<std::int64_t>();
        c.treatmentSuccess = vm["treatment-success"].as<std::int64_t>();
        counts = c;
    }

    std::optional<double> allocationRatio;
    if (vm.count("allocation-ratio"))
        allocationRatio = vm["allocation-ratio"].as<double>();

    parsed.configuration.emplace(
        command,
        vm["alpha"].as<double>(),
        vm["power"].as<double>(),
        allocationRatio,
        AbTestConfiguration::parseOutputFormat(vm["format"].as<std::string>()),
        counts,
        vm.count("control-file") ? vm["control-file"].as<std::string>() : std::string(),
        vm.count("treatment-file") ? vm["treatment-file"].as<std::string>() : std::string(),
        vm.count("log-file") ? vm["log-file"].as<std::string>() : std::string(),
        vm.count("verbose") > 0);

    return parsed;
}

} // namespace cli
} // namespace abstats
