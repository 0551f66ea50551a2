#include "rclogic/utils/DateTimeUtils.hpp"

#include <cctype>

namespace rclogic {
namespace utils {

namespace {

struct ParseState {
    DateTimeFields fields;
    bool has_year = false;
    bool has_month = false;
    bool has_day = false;
};

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// 读取恰好 width 位数字
bool readDigits(std::string_view text, size_t pos, size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        const char c = text[pos + i];
        if (!isDigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool inRange(char directive, int value) {
    switch (directive) {
        case 'm': return value >= 1 && value <= 12;
        case 'd': return value >= 1 && value <= 31;
        case 'H': return value >= 0 && value <= 23;
        case 'M': return value >= 0 && value <= 59;
        case 'S': return value >= 0 && value <= 61;
        default:  return false;
    }
}

void assign(ParseState& state, char directive, int value) {
    switch (directive) {
        case 'Y': state.fields.year = value; state.has_year = true; break;
        case 'y':
            // 与 POSIX 一致：69-99 -> 19xx，00-68 -> 20xx
            state.fields.year = value < 69 ? 2000 + value : 1900 + value;
            state.has_year = true;
            break;
        case 'm': state.fields.month = value; state.has_month = true; break;
        case 'd': state.fields.day = value; state.has_day = true; break;
        case 'H': state.fields.hour = value; break;
        case 'M': state.fields.minute = value; break;
        case 'S': state.fields.second = value; break;
        default: break;
    }
}

// 变宽字段（1~2位）需要回溯，因此递归匹配
bool matchFrom(std::string_view text, size_t ti, std::string_view format, size_t fi, ParseState& state) {
    if (fi == format.size()) {
        return ti == text.size();
    }

    const char fc = format[fi];
    if (fc != '%') {
        if (ti < text.size() && text[ti] == fc) {
            return matchFrom(text, ti + 1, format, fi + 1, state);
        }
        return false;
    }

    if (fi + 1 >= format.size()) {
        return false;
    }

    const char directive = format[fi + 1];
    switch (directive) {
        case '%':
            if (ti < text.size() && text[ti] == '%') {
                return matchFrom(text, ti + 1, format, fi + 2, state);
            }
            return false;

        case 'Y':
        case 'y': {
            int value = 0;
            const size_t width = directive == 'Y' ? 4 : 2;
            if (!readDigits(text, ti, width, value)) {
                return false;
            }
            ParseState next = state;
            assign(next, directive, value);
            if (matchFrom(text, ti + width, format, fi + 2, next)) {
                state = next;
                return true;
            }
            return false;
        }

        case 'm':
        case 'd':
        case 'H':
        case 'M':
        case 'S':
            for (size_t width = 2; width >= 1; --width) {
                int value = 0;
                if (!readDigits(text, ti, width, value) || !inRange(directive, value)) {
                    continue;
                }
                ParseState next = state;
                assign(next, directive, value);
                if (matchFrom(text, ti + width, format, fi + 2, next)) {
                    state = next;
                    return true;
                }
            }
            return false;

        default:
            return false;
    }
}

} // namespace

int DateTimeUtils::daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

std::optional<DateTimeFields> DateTimeUtils::parse(std::string_view text, std::string_view format) {
    if (text.empty() || format.empty()) {
        return std::nullopt;
    }

    ParseState state;
    if (!matchFrom(text, 0, format, 0, state)) {
        return std::nullopt;
    }

    // 日期部分需要是真实存在的日子，例如 2023-02-29 不合法
    if (state.has_day) {
        const int month = state.has_month ? state.fields.month : 1;
        const int year = state.has_year ? state.fields.year : 1900;
        if (state.fields.day > daysInMonth(year, month)) {
            return std::nullopt;
        }
    }

    return state.fields;
}

std::optional<std::string> DateTimeUtils::findInvalidDirective(std::string_view format) {
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%') {
            continue;
        }
        if (i + 1 >= format.size()) {
            return std::string("%");
        }
        const char directive = format[i + 1];
        switch (directive) {
            case 'Y': case 'y': case 'm': case 'd':
            case 'H': case 'M': case 'S': case '%':
                ++i;
                break;
            default:
                return std::string{'%', directive};
        }
    }
    return std::nullopt;
}

}} // namespace rclogic::utils
