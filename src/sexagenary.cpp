#include "lunisolar/sexagenary.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "lunisolar/tables.h"

namespace lunisolar {
    namespace {
        // Phase constants calibrated against the reference dataset.
        constexpr int kYearCycleBase = 36;
        constexpr int kMonthCycleBase = 14;
        constexpr int kDayCycleBase = 10;

        constexpr std::array<std::string_view, 10> kStemsChinese{ {
            "甲", "乙", "丙", "丁", "戊", "己", "庚", "辛", "壬", "癸"
        } };
        constexpr std::array<std::string_view, 10> kStemsKorean{ {
            "갑", "을", "병", "정", "무", "기", "경", "신", "임", "계"
        } };
        constexpr std::array<std::string_view, 12> kBranchesChinese{ {
            "子", "丑", "寅", "卯", "辰", "巳", "午", "未", "申", "酉", "戌", "亥"
        } };
        constexpr std::array<std::string_view, 12> kBranchesKorean{ {
            "자", "축", "인", "묘", "진", "사", "오", "미", "신", "유", "술", "해"
        } };

        inline bool IsValidCycle(int cycle) noexcept {
            return cycle >= 1 && cycle <= kSexagenaryCycleLength;
        }

        template<std::size_t N>
        bool MatchSymbol(const std::array<std::string_view, N> &symbols,
                         std::string_view text,
                         std::size_t &outIndex,
                         std::size_t &outLength) noexcept {
            for (std::size_t i = 0; i < symbols.size(); ++i) {
                if (text.substr(0, symbols[i].size()) == symbols[i]) {
                    outIndex = i;
                    outLength = symbols[i].size();
                    return true;
                }
            }
            return false;
        }
    }

    int YearlyCycleOf(int lunarYear) noexcept {
        return 1 + ((lunarYear - detail::kBaseLunarYear) + kYearCycleBase) % kSexagenaryCycleLength;
    }

    int MonthlyCycleOf(int lunarYear, int lunarMonth, bool isLeapMonth) noexcept {
        if (isLeapMonth) {
            return 0;
        }
        const int months = (lunarYear - detail::kBaseLunarYear) * 12 + (lunarMonth - 1);
        return 1 + (months + kMonthCycleBase) % kSexagenaryCycleLength;
    }

    int DailyCycleOf(std::int32_t julianDay) noexcept {
        const std::int32_t days = (julianDay + detail::kLunarEpochOffset) - detail::kLunarBaseJulianDay;
        const std::int32_t phase = (days + kDayCycleBase) % kSexagenaryCycleLength;
        return 1 + static_cast<int>((phase + kSexagenaryCycleLength) % kSexagenaryCycleLength);
    }

    std::string_view HeavenlyStem(int cycle, Script script) noexcept {
        if (!IsValidCycle(cycle)) {
            return {};
        }
        const auto index = static_cast<std::size_t>((cycle - 1) % 10);
        return script == Script::Chinese ? kStemsChinese[index] : kStemsKorean[index];
    }

    std::string_view EarthlyBranch(int cycle, Script script) noexcept {
        if (!IsValidCycle(cycle)) {
            return {};
        }
        const auto index = static_cast<std::size_t>((cycle - 1) % 12);
        return script == Script::Chinese ? kBranchesChinese[index] : kBranchesKorean[index];
    }

    std::string SexagenaryLabel(int cycle, Script script) {
        if (!IsValidCycle(cycle)) {
            return {};
        }
        std::string label(HeavenlyStem(cycle, script));
        label.append(EarthlyBranch(cycle, script));
        return label;
    }

    StatusCode ParseSexagenaryLabel(std::string_view label, int &outCycle) noexcept {
        outCycle = 0;
        if (label.empty()) {
            return StatusCode::Ok;
        }

        std::size_t stem = 0;
        std::size_t consumed = 0;
        if (!MatchSymbol(kStemsChinese, label, stem, consumed)
            && !MatchSymbol(kStemsKorean, label, stem, consumed)) {
            return StatusCode::MalformedReferenceSymbol;
        }
        auto rest = label.substr(consumed);
        std::size_t branch = 0;
        if (!MatchSymbol(kBranchesChinese, rest, branch, consumed)
            && !MatchSymbol(kBranchesKorean, rest, branch, consumed)) {
            return StatusCode::MalformedReferenceSymbol;
        }
        if (consumed != rest.size()) {
            return StatusCode::MalformedReferenceSymbol;
        }

        for (int index = 0; index < kSexagenaryCycleLength; ++index) {
            if (static_cast<std::size_t>(index % 10) == stem && static_cast<std::size_t>(index % 12) == branch) {
                outCycle = index + 1;
                return StatusCode::Ok;
            }
        }
        // Stem and branch of opposite parity never pair up.
        return StatusCode::MalformedReferenceSymbol;
    }
}
