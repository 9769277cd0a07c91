#include "ObservationFileReader.h"
#include <fstream>
#include <limits>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "AbStatsException.h"

namespace fs = boost::filesystem;

namespace abstats
{
namespace io
{

std::vector<double> ObservationFileReader::readFile(const std::string& path)
{
    boost::system::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec && ec != boost::system::errc::no_such_file_or_directory)
        throw InputFileError("Cannot access observation file " + path + ": " + ec.message());

    if (!fs::exists(status) || !fs::is_regular_file(status))
        throw InputFileError("Observation file not found: " + path);

    std::ifstream in(path);
    if (!in.is_open())
        throw InputFileError("Cannot open observation file: " + path);

    return readStream(in, path);
}

std::vector<double> ObservationFileReader::readStream(std::istream& in, const std::string& sourceName)
{
    std::vector<double> values;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(in, line))
    {
        ++lineNumber;
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        std::vector<std::string> tokens;
        boost::algorithm::split(tokens, line, boost::algorithm::is_any_of(",; \t\r"),
                                boost::algorithm::token_compress_on);

        for (const auto& token : tokens)
        {
            if (token.empty())
                continue;

            if (isMissingToken(token))
            {
                values.push_back(std::numeric_limits<double>::quiet_NaN());
                continue;
            }

            try
            {
                values.push_back(boost::lexical_cast<double>(token));
            }
            catch (const boost::bad_lexical_cast&)
            {
                throw InputFileError(sourceName + ":" + std::to_string(lineNumber)
                                     + ": not a number: '" + token + "'");
            }
        }
    }

    if (in.bad())
        throw InputFileError("Error while reading " + sourceName);

    return values;
}

bool ObservationFileReader::isMissingToken(const std::string& token)
{
    return boost::algorithm::iequals(token, "nan") || boost::algorithm::iequals(token, "na");
}

} // namespace io
} // namespace abstats
