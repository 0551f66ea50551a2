#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace rclogic {
namespace utils {

/**
 * @brief 日期时间解析结果
 */
struct DateTimeFields {
    int year = 1900;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief 日期时间工具类 - strptime风格的格式匹配
 *
 * 支持的指令：%Y（4位年）%y（2位年）%m %d %H %M %S（1~2位）以及 %%。
 * 其余字符按字面量精确匹配；年月日同时出现时校验日历合法性（含闰年）。
 */
class DateTimeUtils {
public:
    /**
     * @brief 按格式解析文本，整串匹配成功才返回结果
     * @param text 待解析文本
     * @param format strptime风格格式
     * @return 解析出的字段，不匹配时为空
     */
    static std::optional<DateTimeFields> parse(std::string_view text, std::string_view format);

    /**
     * @brief 文本是否完整匹配格式
     */
    static bool matchesFormat(std::string_view text, std::string_view format) {
        return parse(text, format).has_value();
    }

    /**
     * @brief 查找格式串中不支持的指令
     * @return 第一个非法指令（如 "%Q"，末尾孤立的 "%"），格式合法时为空
     */
    static std::optional<std::string> findInvalidDirective(std::string_view format);

    static bool isLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    static int daysInMonth(int year, int month);
};

}} // namespace rclogic::utils
