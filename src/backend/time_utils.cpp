/**
 * @file time_utils.cpp
 * @brief UTC时间工具实现
 */
#include "time_utils.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace {

// 校验tm字段没有被timegm规范化（例如2月30日会变成3月2日）
bool toUtc(std::tm tm, time_t& out) {
    std::tm original = tm;
    time_t t = timegm(&tm);
    if (t == static_cast<time_t>(-1)) {
        return false;
    }

    std::tm check{};
    gmtime_r(&t, &check);
    if (check.tm_year != original.tm_year ||
        check.tm_mon != original.tm_mon ||
        check.tm_mday != original.tm_mday ||
        check.tm_hour != original.tm_hour ||
        check.tm_min != original.tm_min ||
        check.tm_sec != original.tm_sec) {
        return false;
    }

    out = t;
    return true;
}

bool readDigits(const std::string& text, size_t& pos, size_t count, int& value) {
    if (pos + count > text.size()) return false;
    value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

// YYYY-MM-DD，逐位检查
bool hasDateShape(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') return false;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

}  // namespace

bool parseIso8601(const std::string& text, time_t& out) {
    // 1. 日期部分和时间部分
    if (text.size() < 19 || !hasDateShape(text)) return false;
    if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') return false;

    std::string normalized = text.substr(0, 19);
    normalized[10] = 'T';

    std::tm tm{};
    std::istringstream in(normalized);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return false;

    time_t t;
    if (!toUtc(tm, t)) return false;

    size_t pos = 19;

    // 2. 小数秒，直接截断
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
            ++digits;
        }
        if (digits == 0) return false;
    }

    // 3. 时区后缀
    if (pos == text.size()) {
        out = t;
        return true;
    }

    if ((text[pos] == 'Z' || text[pos] == 'z') && pos + 1 == text.size()) {
        out = t;
        return true;
    }

    if (text[pos] == '+' || text[pos] == '-') {
        int sign = text[pos] == '+' ? 1 : -1;
        ++pos;

        int hours = 0;
        int minutes = 0;
        if (!readDigits(text, pos, 2, hours)) return false;
        if (pos < text.size() && text[pos] == ':') ++pos;
        if (!readDigits(text, pos, 2, minutes)) return false;
        if (pos != text.size() || hours > 23 || minutes > 59) return false;

        // 本地时间减去偏移量得到UTC
        out = t - sign * (hours * 3600 + minutes * 60);
        return true;
    }

    return false;
}

std::string formatIso8601(time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

bool parseDate(const std::string& text, time_t& dayStart) {
    if (text.size() != 10 || !hasDateShape(text)) return false;

    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%d");
    if (in.fail()) return false;

    return toUtc(tm, dayStart);
}

std::string formatDate(time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}
