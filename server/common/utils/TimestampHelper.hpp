#pragma once

/**
 * @brief 时间戳助手
 *
 * 统一使用 system_clock 时间点，对外序列化为 ISO 8601 UTC（毫秒精度）
 */
class TimestampHelper {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    static std::string now() {
        return format(Clock::now());
    }

    /**
     * @brief 时间点 → "YYYY-MM-DDTHH:MM:SS.mmmZ"
     */
    static std::string format(TimePoint tp) {
        auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
        auto dp = std::chrono::floor<std::chrono::days>(ms);
        std::chrono::year_month_day ymd{dp};
        std::chrono::hh_mm_ss hms{ms - dp};

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
            << std::setw(2) << hms.hours().count() << ":"
            << std::setw(2) << hms.minutes().count() << ":"
            << std::setw(2) << hms.seconds().count() << "."
            << std::setw(3) << hms.subseconds().count() << "Z";
        return oss.str();
    }

    /**
     * @brief 解析 ISO 8601 UTC 字符串（"T" 或空格分隔，秒后的小数与 Z 可选）
     * @return 解析失败返回 nullopt
     */
    static std::optional<TimePoint> parse(const std::string& str) {
        int y = 0, mon = 0, d = 0, h = 0, mi = 0, s = 0;
        char sep = 0;
        if (std::sscanf(str.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &y, &mon, &d, &sep, &h, &mi, &s) != 7) {
            return std::nullopt;
        }
        if (sep != 'T' && sep != ' ') return std::nullopt;

        std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mon)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
        if (!ymd.ok() || h > 23 || mi > 59 || s > 60) return std::nullopt;

        TimePoint tp = std::chrono::sys_days{ymd}
            + std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s};

        // 毫秒部分
        auto dot = str.find('.', 19);
        if (dot == 19) {
            int millis = 0, digits = 0;
            for (size_t i = dot + 1; i < str.size() && std::isdigit(static_cast<unsigned char>(str[i])); ++i) {
                if (digits < 3) {
                    millis = millis * 10 + (str[i] - '0');
                    ++digits;
                }
            }
            while (digits++ < 3) millis *= 10;
            tp += std::chrono::milliseconds{millis};
        }
        return tp;
    }

    /** Unix 秒（含小数）→ 时间点 */
    static TimePoint fromEpochSeconds(double seconds) {
        return TimePoint{std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(seconds))};
    }

    /** 两个时间点的间隔（秒） */
    static double secondsBetween(TimePoint from, TimePoint to) {
        return std::chrono::duration<double>(to - from).count();
    }
};
