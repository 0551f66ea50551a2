#pragma once

#include "rclogic/core/CacheSystem.hpp"
#include "rclogic/core/ClassifierConfig.hpp"
#include "rclogic/core/RedcapValue.hpp"
#include "rclogic/core/ValueClassifier.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rclogic {
namespace columnar {
class RedcapValueArray;
}

namespace core {

/**
 * @brief 值驻留池
 *
 * 相同原始串复用同一份 ValueData，只是内存优化：
 * 是否命中都不影响相等性。容量满时按LRU淘汰。
 */
class ValueInternPool {
public:
    using Cache = LRUCache<std::string, std::shared_ptr<const ValueData>>;

    explicit ValueInternPool(size_t capacity);

    RedcapValue intern(std::string_view raw, const ValueClassifier& classifier);

    size_t size() const { return cache_.size(); }
    size_t capacity() const noexcept { return cache_.capacity(); }
    Cache::Statistics getStatistics() const { return cache_.getStatistics(); }
    void clear() { cache_.clear(); }

private:
    Cache cache_;
};

/**
 * @brief 值工厂：分类器 + 可选的驻留池
 *
 * 同一个工厂的配置在构造后不再改变；需要不同缺失代码或日期格式时
 * 另建一个工厂。
 */
class ValueFactory {
public:
    explicit ValueFactory(ClassifierConfig config = ClassifierConfig::standard());
    ~ValueFactory();

    ValueFactory(const ValueFactory&) = delete;
    ValueFactory& operator=(const ValueFactory&) = delete;

    /**
     * @brief 进程级默认工厂（标准配置）
     */
    static ValueFactory& getDefault();

    RedcapValue makeValue(std::string_view raw) const;

    columnar::RedcapValueArray makeArray(const std::vector<std::string>& raw_values) const;

    Classification classify(std::string_view raw) const { return classifier_.classify(raw); }

    const ValueClassifier& classifier() const noexcept { return classifier_; }
    const ClassifierConfig& config() const noexcept { return classifier_.getConfig(); }

    /**
     * @brief 驻留池，未启用时为 nullptr
     */
    ValueInternPool* internPool() const noexcept { return intern_pool_.get(); }

private:
    ValueClassifier classifier_;
    std::unique_ptr<ValueInternPool> intern_pool_;
};

/**
 * @brief 使用默认工厂构造单个值
 */
RedcapValue makeValue(std::string_view raw);

}} // namespace rclogic::core
