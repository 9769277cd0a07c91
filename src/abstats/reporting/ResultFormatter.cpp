#include "ResultFormatter.h"
#include <algorithm>
#include <cmath>
#include <boost/format.hpp>

namespace abstats
{
namespace reporting
{

namespace
{
const std::string kNotANumber("NaN");
const std::string kUndefinedMss("N/A (∞)");
}

std::string ResultFormatter::formatFixed(double value, int decimals)
{
    if (std::isnan(value))
        return kNotANumber;

    if (std::isinf(value))
        return value > 0 ? "inf" : "-inf";

    return (boost::format("%1$." + std::to_string(decimals) + "f") % value).str();
}

std::string ResultFormatter::formatThousands(std::uint64_t value)
{
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i)
    {
        if (i != 0 && (i % 3) == lead)
            out.push_back(',');
        out.push_back(digits[i]);
    }

    return out;
}

std::string ResultFormatter::formatPercent(const std::optional<double>& percent)
{
    if (!percent)
        return kNotANumber + "%";

    return formatFixed(*percent, 2) + "%";
}

std::string ResultFormatter::formatAbsoluteInterval(const ConfidenceInterval& ci)
{
    return (boost::format("[%1%, %2%]") % formatFixed(ci.lower, 4) % formatFixed(ci.upper, 4)).str();
}

std::string ResultFormatter::formatRelativeInterval(const std::optional<ConfidenceInterval>& ci)
{
    if (!ci)
        return "[" + kNotANumber + "%, " + kNotANumber + "%]";

    return (boost::format("[%1%%%, %2%%%]") % formatFixed(ci->lower, 2) % formatFixed(ci->upper, 2)).str();
}

std::string ResultFormatter::formatMss(const std::optional<MssOutcome>& mss)
{
    if (!mss)
        return kUndefinedMss;

    return (boost::format("%1%%% (%2%)")
            % formatFixed(mss->actualRatio * 100.0, 2)
            % formatThousands(mss->requiredN)).str();
}

std::vector<std::string> ResultFormatter::columnNames(AbTestKind kind)
{
    std::vector<std::string> names = {"metric_formula", "metric_value", "delta_relative",
                                      "delta_absolute", "p_value", "CI_relative",
                                      "CI_absolute", "MSS_posthoc", "statistic"};
    if (kind == AbTestKind::WelchTTest)
        names.push_back("df");

    return names;
}

std::vector<std::string> ResultFormatter::formatRow(const AbTestResult& result)
{
    std::vector<std::string> row = {result.metricFormula,
                                    formatFixed(result.metricValue, 6),
                                    formatPercent(result.deltaRelative),
                                    formatFixed(result.deltaAbsolute, 6),
                                    formatFixed(result.pValue, 5),
                                    formatRelativeInterval(result.ciRelative),
                                    formatAbsoluteInterval(result.ciAbsolute),
                                    formatMss(result.mssPosthoc),
                                    formatFixed(result.statistic, 2)};
    if (result.kind == AbTestKind::WelchTTest)
        row.push_back(result.df ? formatFixed(*result.df, 2) : kNotANumber);

    return row;
}

void ResultFormatter::writeTable(std::ostream& os, const AbTestResult& result)
{
    const std::vector<std::string> header = columnNames(result.kind);
    const std::vector<std::string> row = formatRow(result);

    std::vector<std::size_t> widths(header.size());
    for (std::size_t i = 0; i < header.size(); ++i)
        widths[i] = std::max(header[i].size(), row[i].size());

    auto writeLine = [&os, &widths](const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i)
        {
            if (i != 0)
                os << "  ";
            os << cells[i] << std::string(widths[i] - cells[i].size(), ' ');
        }
        os << '\n';
    };

    writeLine(header);
    writeLine(row);
}

void ResultFormatter::writeCsv(std::ostream& os, const AbTestResult& result)
{
    auto writeLine = [&os](const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i)
        {
            if (i != 0)
                os << ',';
            os << quoteCsvField(cells[i]);
        }
        os << '\n';
    };

    writeLine(columnNames(result.kind));
    writeLine(formatRow(result));
}

std::string ResultFormatter::quoteCsvField(const std::string& field)
{
    if (field.find_first_of(",\"\n") == std::string::npos)
        return field;

    std::string quoted("\"");
    for (char c : field)
    {
        if (c == '"')
            quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace reporting
} // namespace abstats
