#pragma once

#include <istream>
#include <string>
#include <vector>

namespace abstats
{
namespace io
{

/**
 * @brief Reads a sample of real-valued observations
 *
 * Values may be separated by commas, semicolons, whitespace or newlines.
 * Empty tokens are ignored. "nan", "NaN" and "NA" (any case) mark a missing
 * observation and are returned as quiet NaN so the statistics layer can
 * drop them. Lines starting with '#' are comments.
 */
class ObservationFileReader
{
public:
    /**
     * @throws abstats::InputFileError if the file cannot be opened or a token
     *         is not a number
     */
    static std::vector<double> readFile(const std::string& path);

    /**
     * @param sourceName used in error messages only
     * @throws abstats::InputFileError on an unparsable token
     */
    static std::vector<double> readStream(std::istream& in, const std::string& sourceName);

    static bool isMissingToken(const std::string& token);
};

} // namespace io
} // namespace abstats
