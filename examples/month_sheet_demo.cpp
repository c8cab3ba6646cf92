#include <charconv>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "lunisolar/config.h"
#include "lunisolar/converter.h"
#include "lunisolar/julian_day.h"
#include "lunisolar/sexagenary.h"
#include "lunisolar/status.h"

namespace {
    constexpr int kColumnWidth = 10;

    const char *kWeekdayHeader[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

    // Whole-string decimal integer that fits in int.
    bool ParseNumber(std::string_view text, int &outValue) {
        if (text.empty()) {
            return false;
        }
        auto result = std::from_chars(text.data(), text.data() + text.size(), outValue);
        return result.ec == std::errc{} && result.ptr == text.data() + text.size();
    }

    // Day number followed by the lunar date, "*" marking a leap month.
    std::string CellText(const lunisolar::KoreanLunarDate &date) {
        std::string text = std::to_string(date.SolarDay());
        text.append(" ");
        if (date.LunarDay() == 1) {
            text.append(std::to_string(date.LunarMonth()));
            text.append(date.IsLunarLeapMonth() ? "*" : "");
            text.append("/");
        }
        text.append(std::to_string(date.LunarDay()));
        return text;
    }
}

int main(int argc, char **argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <year> <month>" << std::endl;
        return 2;
    }
    int year = 0;
    int month = 0;
    if (!ParseNumber(argv[1], year) || !ParseNumber(argv[2], month)) {
        std::cerr << "Year and month must be integers" << std::endl;
        return 2;
    }
    auto config = lunisolar::MakeDefaultConfig();

    if (month < 1 || month > 12) {
        std::cerr << lunisolar::StatusName(lunisolar::StatusCode::OutOfRangeMonth)
                << ": Month must be bound between 1 and 12" << std::endl;
        return 1;
    }

    auto first = lunisolar::LunarDateOf(year, month, 1);
    if (first.status != lunisolar::StatusCode::Ok) {
        std::cerr << lunisolar::StatusName(first.status) << ": " << first.diagnostics << std::endl;
        return 1;
    }

    const auto yearLabel = lunisolar::SexagenaryLabel(first.date->YearlyCycle(), lunisolar::Script::Chinese);
    std::cout << year << "-" << std::setw(2) << std::setfill('0') << month << std::setfill(' ')
            << "  lunar " << first.date->LunarYear() << " " << yearLabel << std::endl;
    for (const char *name: kWeekdayHeader) {
        std::cout << std::left << std::setw(kColumnWidth) << name;
    }
    std::cout << std::endl;

    const int leading = static_cast<int>(first.date->SolarDayOfWeek()) - 1;
    for (int i = 0; i < leading; ++i) {
        std::cout << std::setw(kColumnWidth) << "";
    }

    int column = leading;
    const int days = lunisolar::DaysOfSolarMonth(year, month);
    for (int day = 1; day <= days; ++day) {
        auto result = lunisolar::LunarDateOf(year, month, day);
        if (result.status != lunisolar::StatusCode::Ok) {
            std::cerr << std::endl << lunisolar::StatusName(result.status) << ": " << result.diagnostics << std::endl;
            return 1;
        }
        std::cout << std::left << std::setw(kColumnWidth) << CellText(*result.date);
        if (++column == 7) {
            column = 0;
            std::cout << std::endl;
        }
    }
    if (column != 0) {
        std::cout << std::endl;
    }

    std::cout << "Last day: " << lunisolar::LunarDateOf(year, month, days).date->Describe(config) << std::endl;
    return 0;
}
