#pragma once

#include "rclogic/core/CacheSystem.hpp"
#include "rclogic/core/Expected.hpp"
#include "rclogic/logic/CompiledPredicate.hpp"
#include "rclogic/logic/LogicLowering.hpp"
#include "rclogic/logic/LogicParser.hpp"
#include "rclogic/logic/TranslatorOptions.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rclogic {
namespace logic {

/**
 * @brief 单条分支逻辑的翻译结果
 */
struct TranslationResult {
    std::shared_ptr<const CompiledPredicate> predicate;
    std::set<std::string> referenced_fields;
};

/**
 * @brief 数据字典级别的批量翻译结果，键为字段名
 */
struct BatchTranslation {
    std::map<std::string, TranslationResult> translated;
    std::map<std::string, core::Error> failed;
    std::vector<std::string> skipped;  // 分支逻辑为空的字段

    bool allSucceeded() const noexcept { return failed.empty(); }
};

/**
 * @brief 分支逻辑翻译器
 *
 * 分支逻辑串 -> 预处理 -> 具体语法树 -> 降级 -> CompiledPredicate。
 * 编译结果按原始逻辑串缓存在线程安全的LRU缓存中。
 */
class LogicTranslator {
public:
    explicit LogicTranslator(TranslatorOptions options = TranslatorOptions());

    LogicTranslator(const LogicTranslator&) = delete;
    LogicTranslator& operator=(const LogicTranslator&) = delete;

    /**
     * @brief 翻译分支逻辑
     * @throws ParseException 逻辑串不符合文法
     */
    TranslationResult translate(const std::string& logic);

    /**
     * @brief 不抛异常的版本，错误以 Error 返回
     */
    core::Result<TranslationResult> tryTranslate(const std::string& logic);

    /**
     * @brief 翻译整个数据字典的分支逻辑（字段名 -> 逻辑串）
     */
    BatchTranslation translateAll(const std::map<std::string, std::string>& logic_by_field);

    /**
     * @brief 翻译并对数据表求值
     */
    columnar::BooleanMask evaluate(const std::string& logic, const columnar::DataTable& table);

    using PredicateCache = core::LRUCache<std::string, std::shared_ptr<const CompiledPredicate>>;

    PredicateCache::Statistics getCacheStatistics() const { return cache_.getStatistics(); }
    size_t cacheSize() const { return cache_.size(); }
    void clearCache() { cache_.clear(); }

    const TranslatorOptions& options() const noexcept { return options_; }

private:
    TranslatorOptions options_;
    LogicParser parser_;
    LogicLowering lowering_;
    PredicateCache cache_;

    std::shared_ptr<const CompiledPredicate> compile(const std::string& logic) const;
};

}} // namespace rclogic::logic
