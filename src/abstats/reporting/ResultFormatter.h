#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "AbTestResult.h"
#include "StatisticalTypes.h"

namespace abstats
{
namespace reporting
{

/**
 * @brief Renders AbTestResult rows as text
 *
 * Rounding rules: p-value 5 decimals, statistic and df 2 decimals,
 * percentages 2 decimals, absolute interval 4 decimals, metric value and
 * absolute delta 6 decimals. Undefined relative values print as NaN and an
 * undefined post-hoc sample size as "N/A (∞)".
 */
class ResultFormatter
{
public:
    static std::string formatFixed(double value, int decimals);

    // 1234567 -> "1,234,567"
    static std::string formatThousands(std::uint64_t value);

    static std::string formatPercent(const std::optional<double>& percent);

    static std::string formatAbsoluteInterval(const ConfidenceInterval& ci);

    static std::string formatRelativeInterval(const std::optional<ConfidenceInterval>& ci);

    // "<actual/required as percent>% (<required n>)"
    static std::string formatMss(const std::optional<MssOutcome>& mss);

    static std::vector<std::string> columnNames(AbTestKind kind);

    static std::vector<std::string> formatRow(const AbTestResult& result);

    /**
     * @brief Header and value rows with columns padded to a common width
     */
    static void writeTable(std::ostream& os, const AbTestResult& result);

    /**
     * @brief Header line and one value line, RFC 4180 quoting where needed
     */
    static void writeCsv(std::ostream& os, const AbTestResult& result);

private:
    static std::string quoteCsvField(const std::string& field);
};

} // namespace reporting
} // namespace abstats
