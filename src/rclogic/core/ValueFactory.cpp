#include "rclogic/core/ValueFactory.hpp"
#include "rclogic/columnar/RedcapValueArray.hpp"
#include "rclogic/utils/ModuleLoggers.hpp"

namespace rclogic {
namespace core {

// ========== ValueInternPool ==========

ValueInternPool::ValueInternPool(size_t capacity)
    : cache_(capacity) {
}

RedcapValue ValueInternPool::intern(std::string_view raw, const ValueClassifier& classifier) {
    size_t evicted = 0;
    auto data = cache_.getOrCreate(std::string(raw), [&]() {
        const Classification classification = classifier.classify(raw);
        return std::make_shared<const ValueData>(
            ValueData{std::string(raw), classification.numeric_value, classification.category});
    }, &evicted);

    if (evicted > 0) {
        RCLOGIC_LOG_CLASSIFIER_DEBUG("Intern pool full ({}), evicted {} entr{}",
                                     cache_.capacity(), evicted, evicted == 1 ? "y" : "ies");
    }
    return RedcapValue(std::move(data));
}

// ========== ValueFactory ==========

ValueFactory::ValueFactory(ClassifierConfig config)
    : classifier_(std::move(config)) {
    const auto& cfg = classifier_.getConfig();
    if (cfg.enable_interning && cfg.intern_capacity > 0) {
        intern_pool_ = std::make_unique<ValueInternPool>(cfg.intern_capacity);
    }
    CORE_DEBUG("ValueFactory created: {} missing code(s), {} date format(s), interning {}",
               cfg.missing_codes.size(), cfg.date_formats.size(),
               intern_pool_ ? "on" : "off");
}

ValueFactory::~ValueFactory() = default;

ValueFactory& ValueFactory::getDefault() {
    static ValueFactory instance;
    return instance;
}

RedcapValue ValueFactory::makeValue(std::string_view raw) const {
    if (raw.empty()) {
        return RedcapValue::missing();
    }
    if (intern_pool_) {
        return intern_pool_->intern(raw, classifier_);
    }
    return RedcapValue(std::string(raw), classifier_.classify(raw));
}

columnar::RedcapValueArray ValueFactory::makeArray(const std::vector<std::string>& raw_values) const {
    return columnar::RedcapValueArray::fromRaw(raw_values, classifier_);
}

RedcapValue makeValue(std::string_view raw) {
    return ValueFactory::getDefault().makeValue(raw);
}

}} // namespace rclogic::core
