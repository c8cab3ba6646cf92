#include "lunisolar/korean_lunar_date.h"

#include <string>

#include "lunisolar/lunar_month.h"
#include "lunisolar/sexagenary.h"

namespace lunisolar {
    namespace {
        void AppendCycle(std::string &out, const char *name, int cycle, LabelStyle style) {
            out.append(name);
            out.push_back('=');
            out.append(std::to_string(cycle));
            if (cycle == 0) {
                return;
            }
            out.append(" (");
            switch (style) {
                case LabelStyle::Chinese:
                    out.append(SexagenaryLabel(cycle, Script::Chinese));
                    break;
                case LabelStyle::Korean:
                    out.append(SexagenaryLabel(cycle, Script::Korean));
                    break;
                case LabelStyle::Both:
                    out.append(SexagenaryLabel(cycle, Script::Chinese));
                    out.append(", ");
                    out.append(SexagenaryLabel(cycle, Script::Korean));
                    break;
            }
            out.push_back(')');
        }

        inline const char *BoolText(bool value) noexcept {
            return value ? "true" : "false";
        }
    }

    namespace detail {
        KoreanLunarDate AssembleDate(const SolarDate &solar,
                                     std::int32_t julianDay,
                                     int lunarYear,
                                     int lunarMonth,
                                     int lunarDay,
                                     bool isLeapMonth) {
            return KoreanLunarDate(solar,
                                   DayOfWeek(julianDay),
                                   julianDay,
                                   lunarYear,
                                   lunarMonth,
                                   lunarDay,
                                   isLeapMonth,
                                   DaysOfMonth(lunarYear, lunarMonth, isLeapMonth),
                                   DailyCycleOf(julianDay),
                                   MonthlyCycleOf(lunarYear, lunarMonth, isLeapMonth),
                                   YearlyCycleOf(lunarYear));
        }
    }

    KoreanLunarDate::KoreanLunarDate(const SolarDate &solar,
                                     Weekday dayOfWeek,
                                     std::int32_t julianDay,
                                     int lunarYear,
                                     int lunarMonth,
                                     int lunarDay,
                                     bool isLeapMonth,
                                     int lunarDaysOfMonth,
                                     int dailyCycle,
                                     int monthlyCycle,
                                     int yearlyCycle) noexcept
        : m_SolarYear(solar.year),
          m_SolarMonth(solar.month),
          m_SolarDay(solar.day),
          m_SolarDayOfWeek(dayOfWeek),
          m_SolarLeapYear(lunisolar::IsSolarLeapYear(solar.year)),
          m_JulianDay(julianDay),
          m_LunarYear(lunarYear),
          m_LunarMonth(lunarMonth),
          m_LunarDay(lunarDay),
          m_LunarLeapMonth(isLeapMonth),
          m_LunarDaysOfMonth(lunarDaysOfMonth),
          m_DailyCycle(dailyCycle),
          m_MonthlyCycle(monthlyCycle),
          m_YearlyCycle(yearlyCycle) {
    }

    std::string KoreanLunarDate::Describe(const CalendarConfig &config) const {
        std::string out = "KoreanLunarDate{";
        out.append("solYear=").append(std::to_string(m_SolarYear));
        out.append(", solMonth=").append(std::to_string(m_SolarMonth));
        out.append(", solDay=").append(std::to_string(m_SolarDay));
        out.append(", solDayOfWeek=").append(std::to_string(static_cast<int>(m_SolarDayOfWeek)));
        out.append(", solLeapYear=").append(BoolText(m_SolarLeapYear));
        out.append(", julianDays=").append(std::to_string(m_JulianDay));
        out.append(", lunYear=").append(std::to_string(m_LunarYear));
        out.append(", lunMonth=").append(std::to_string(m_LunarMonth));
        out.append(", lunDay=").append(std::to_string(m_LunarDay));
        out.append(", lunLeapMonth=").append(BoolText(m_LunarLeapMonth));
        out.append(", lunDaysOfMonth=").append(std::to_string(m_LunarDaysOfMonth));
        out.append(", ");
        AppendCycle(out, "dailyCycle", m_DailyCycle, config.labelStyle);
        out.append(", ");
        AppendCycle(out, "monthlyCycle", m_MonthlyCycle, config.labelStyle);
        out.append(", ");
        AppendCycle(out, "yearlyCycle", m_YearlyCycle, config.labelStyle);
        out.push_back('}');
        return out;
    }
}
