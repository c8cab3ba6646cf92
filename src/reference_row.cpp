#include "lunisolar/reference_row.h"

#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include "lunisolar/sexagenary.h"

namespace lunisolar {
    namespace {
        constexpr std::array<std::string_view, kReferenceColumnCount> kColumnNames{ {
            "solYear", "solMonth", "solDay", "julianDays", "solDayOfWeek", "solLeapYear", "lunYear",
            "lunMonth", "lunDay", "lunLeapMonth", "lunDaysOfMonth", "dailyCycle", "monthlyCycle", "yearlyCycle"
        } };

        std::string_view Trim(std::string_view text) noexcept {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
                text.remove_prefix(1);
            }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
                text.remove_suffix(1);
            }
            return text;
        }

        StatusCode Malformed(std::size_t column, std::string_view token, std::string &outDiagnostics) {
            outDiagnostics = "Malformed value '";
            outDiagnostics.append(token);
            outDiagnostics.append("' in column ");
            outDiagnostics.append(kColumnNames[column]);
            return StatusCode::MalformedReferenceSymbol;
        }

        bool ParseInt(std::string_view token, int &outValue) noexcept {
            if (token.empty()) {
                return false;
            }
            auto result = std::from_chars(token.data(), token.data() + token.size(), outValue);
            return result.ec == std::errc{} && result.ptr == token.data() + token.size();
        }

        bool ParseBool(std::string_view token, bool &outValue) noexcept {
            auto equalsIgnoreCase = [token](std::string_view expected) {
                if (token.size() != expected.size()) {
                    return false;
                }
                for (std::size_t i = 0; i < token.size(); ++i) {
                    if (std::tolower(static_cast<unsigned char>(token[i])) != expected[i]) {
                        return false;
                    }
                }
                return true;
            };
            if (equalsIgnoreCase("true")) {
                outValue = true;
                return true;
            }
            if (equalsIgnoreCase("false")) {
                outValue = false;
                return true;
            }
            return false;
        }

        bool ParseCycle(std::string_view token, int &outCycle) noexcept {
            if (!token.empty() && std::isdigit(static_cast<unsigned char>(token.front()))) {
                return ParseInt(token, outCycle) && outCycle >= 0 && outCycle <= kSexagenaryCycleLength;
            }
            return ParseSexagenaryLabel(token, outCycle) == StatusCode::Ok;
        }
    }

    StatusCode ParseReferenceRow(std::string_view line, ReferenceRow &outRow, std::string &outDiagnostics) {
        outDiagnostics.clear();
        std::array<std::string_view, kReferenceColumnCount> tokens{};
        std::size_t count = 0;
        std::size_t start = 0;
        while (true) {
            auto comma = line.find(',', start);
            auto token = Trim(line.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
            if (count < tokens.size()) {
                tokens[count] = token;
            }
            ++count;
            if (comma == std::string_view::npos) {
                break;
            }
            start = comma + 1;
        }
        if (count != kReferenceColumnCount) {
            outDiagnostics = "Expected " + std::to_string(kReferenceColumnCount) + " columns, got "
                             + std::to_string(count);
            return StatusCode::InvalidArgument;
        }

        ReferenceRow row{};
        std::array<int *, kReferenceColumnCount> integers{ {
            &row.solarYear, &row.solarMonth, &row.solarDay, nullptr, &row.solarDayOfWeek, nullptr, &row.lunarYear,
            &row.lunarMonth, &row.lunarDay, nullptr, &row.lunarDaysOfMonth, nullptr, nullptr, nullptr
        } };
        for (std::size_t column = 0; column < kReferenceColumnCount; ++column) {
            const auto token = tokens[column];
            bool parsed = true;
            if (integers[column] != nullptr) {
                parsed = ParseInt(token, *integers[column]);
            } else if (column == 3) {
                int julianDay = 0;
                parsed = ParseInt(token, julianDay);
                row.julianDay = julianDay;
            } else if (column == 5) {
                parsed = ParseBool(token, row.solarLeapYear);
            } else if (column == 9) {
                parsed = ParseBool(token, row.lunarLeapMonth);
            } else if (column == 11) {
                parsed = ParseCycle(token, row.dailyCycle);
            } else if (column == 12) {
                parsed = ParseCycle(token, row.monthlyCycle);
            } else {
                parsed = ParseCycle(token, row.yearlyCycle);
            }
            if (!parsed) {
                return Malformed(column, token, outDiagnostics);
            }
        }
        outRow = row;
        return StatusCode::Ok;
    }

    StatusCode LoadReferenceRows(std::istream &input, std::vector<ReferenceRow> &outRows, std::string &outDiagnostics) {
        outDiagnostics.clear();
        std::string line;
        std::size_t lineNumber = 0;
        bool headerSkipped = false;
        while (std::getline(input, line)) {
            ++lineNumber;
            if (Trim(line).empty()) {
                continue;
            }
            if (!headerSkipped) {
                headerSkipped = true;
                continue;
            }
            ReferenceRow row{};
            auto status = ParseReferenceRow(line, row, outDiagnostics);
            if (status != StatusCode::Ok) {
                outDiagnostics.append(" at line ");
                outDiagnostics.append(std::to_string(lineNumber));
                return status;
            }
            outRows.push_back(row);
        }
        return StatusCode::Ok;
    }

    bool Matches(const ReferenceRow &row, const KoreanLunarDate &date) noexcept {
        return row.solarYear == date.SolarYear()
               && row.solarMonth == date.SolarMonth()
               && row.solarDay == date.SolarDay()
               && row.julianDay == date.JulianDay()
               && row.solarDayOfWeek == static_cast<int>(date.SolarDayOfWeek())
               && row.solarLeapYear == date.IsSolarLeapYear()
               && row.lunarYear == date.LunarYear()
               && row.lunarMonth == date.LunarMonth()
               && row.lunarDay == date.LunarDay()
               && row.lunarLeapMonth == date.IsLunarLeapMonth()
               && row.lunarDaysOfMonth == date.LunarDaysOfMonth()
               && row.dailyCycle == date.DailyCycle()
               && row.monthlyCycle == date.MonthlyCycle()
               && row.yearlyCycle == date.YearlyCycle();
    }
}
