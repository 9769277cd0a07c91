#include <exception>
#include <iostream>
#include "AbStatsException.h"
#include "AbStatsVersion.h"
#include "AbTestApplication.h"
#include "CommandLineParser.h"

using namespace abstats;
using namespace abstats::cli;

int main(int argc, char* argv[])
{
    try
    {
        CommandLineParser parser;
        const ParsedCommandLine parsed = parser.parse(argc, argv);

        if (parsed.helpRequested)
        {
            std::cout << parsed.usage;
            return kExitSuccess;
        }

        if (parsed.versionRequested)
        {
            std::cout << "abstats " << ABSTATS_VERSION_STRING << std::endl;
            return kExitSuccess;
        }

        AbTestApplication app(*parsed.configuration);
        return app.run(std::cout, std::cerr);
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << "Run 'abstats --help' for usage." << std::endl;
        return kExitInvalidInput;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitUnexpectedError;
    }
}
