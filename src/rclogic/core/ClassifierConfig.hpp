#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unordered_set>
#include <cstddef>

namespace rclogic {
namespace core {

/**
 * @brief 值分类配置
 *
 * 缺失数据代码与日期格式来自项目配置（由外部加载器提供），
 * 这里只负责承载与校验。
 */
struct ClassifierConfig {
    std::unordered_set<std::string> missing_codes;  // 缺失数据代码集合
    std::vector<std::string> date_formats;          // 有序的日期格式，先匹配者优先
    bool enable_interning = true;                   // 是否启用值驻留池
    size_t intern_capacity = 4096;                  // 驻留池容量

    /**
     * @brief 标准配置：无缺失代码，常用的年月日/日月年/月日年及时间格式
     */
    static ClassifierConfig standard();

    /**
     * @brief 校验日期格式，发现不支持的指令时抛出 ConfigException
     */
    void validate() const;

    ClassifierConfig& withMissingCodes(const std::vector<std::string>& codes);
    ClassifierConfig& withDateFormats(std::vector<std::string> formats);

    /**
     * @brief 解析项目信息导出中的缺失数据代码串
     *
     * 形如 "NA-1, Not asked | NA-2, Unknown"：按 '|' 分条，
     * 每条取第一个逗号之前的部分并去除首尾空白。
     */
    static std::vector<std::string> parseMissingDataCodes(std::string_view text);
};

}} // namespace rclogic::core
