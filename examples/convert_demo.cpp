#include <charconv>
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "lunisolar/config.h"
#include "lunisolar/converter.h"
#include "lunisolar/status.h"
#include "lunisolar/system_clock_adapter.h"

namespace {
    void PrintUsage(const char *program) {
        std::cerr << "Usage: " << program << " solar <year> <month> <day>" << std::endl;
        std::cerr << "       " << program << " lunar <year> <month> <day> [leap]" << std::endl;
        std::cerr << "       " << program << " today" << std::endl;
    }

    // Whole-string decimal integer that fits in int.
    bool ParseNumber(std::string_view text, int &outValue) {
        if (text.empty()) {
            return false;
        }
        auto result = std::from_chars(text.data(), text.data() + text.size(), outValue);
        return result.ec == std::errc{} && result.ptr == text.data() + text.size();
    }

    int Report(const lunisolar::ConversionResult &result, const lunisolar::CalendarConfig &config) {
        if (result.status != lunisolar::StatusCode::Ok) {
            std::cerr << lunisolar::StatusName(result.status) << ": " << result.diagnostics << std::endl;
            return 1;
        }
        std::cout << result.date->Describe(config) << std::endl;
        return 0;
    }
}

int main(int argc, char **argv) {
    auto config = lunisolar::MakeDefaultConfig();
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string command = argv[1];
    if (command == "today" && argc == 2) {
        return Report(lunisolar::LunarDateOf(std::chrono::system_clock::now(), config), config);
    }

    const bool isSolar = command == "solar" && argc == 5;
    const bool isLunar = command == "lunar" && (argc == 5 || argc == 6);
    if (!isSolar && !isLunar) {
        PrintUsage(argv[0]);
        return 2;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!ParseNumber(argv[2], year) || !ParseNumber(argv[3], month) || !ParseNumber(argv[4], day)) {
        std::cerr << "Year, month and day must be integers" << std::endl;
        return 2;
    }

    if (isSolar) {
        return Report(lunisolar::LunarDateOf(year, month, day), config);
    }
    bool leap = false;
    if (argc == 6) {
        if (std::string(argv[5]) != "leap") {
            PrintUsage(argv[0]);
            return 2;
        }
        leap = true;
    }
    return Report(lunisolar::SolarDateOf(year, month, day, leap), config);
}
