#pragma once

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    static std::string trim(const std::string& str) {
        auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char ch) {
            return std::isspace(ch);
        });
        auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char ch) {
            return std::isspace(ch);
        }).base();

        return (start < end) ? std::string(start, end) : std::string();
    }

    static std::string toLower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    static std::string toUpper(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        return result;
    }

    static bool contains(const std::string& str, const std::string& substr) {
        return str.find(substr) != std::string::npos;
    }

    /** 任一关键字作为子串出现 */
    static bool containsAny(const std::string& str, std::initializer_list<const char*> keywords) {
        for (const char* kw : keywords) {
            if (str.find(kw) != std::string::npos) return true;
        }
        return false;
    }

    /**
     * @brief 严格解析整数（整个字符串必须是数字）
     */
    static std::optional<long> parseInt(const std::string& str) {
        if (str.empty()) return std::nullopt;
        long value = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if (ec != std::errc{} || ptr != str.data() + str.size()) return std::nullopt;
        return value;
    }

    /**
     * @brief 严格解析浮点数（允许首尾空白）
     */
    static std::optional<double> parseDouble(const std::string& str) {
        auto s = trim(str);
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(s.c_str(), &end);
        if (errno == ERANGE || end != s.c_str() + s.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }

    /** 浮点数 → 文本（不受全局 locale 影响，保留有效精度） */
    static std::string formatNumber(double value) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(15) << value;
        return oss.str();
    }
};
