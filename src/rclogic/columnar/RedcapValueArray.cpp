#include "rclogic/columnar/RedcapValueArray.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/core/ValueClassifier.hpp"
#include "rclogic/core/ValueFactory.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace rclogic {
namespace columnar {

using core::ArithmeticOp;
using core::CompareOp;
using core::Operand;
using core::RedcapValue;
using core::ValueCategory;
using core::ValueSemantics;

RedcapValueArray::RedcapValueArray(std::vector<double> numeric_values,
                                   std::vector<std::string> raw_values,
                                   std::vector<ValueCategory> categories)
    : numeric_(std::move(numeric_values))
    , raw_(std::move(raw_values))
    , categories_(std::move(categories)) {
    checkInvariant();
}

RedcapValueArray RedcapValueArray::fromRaw(const std::vector<std::string>& raw_values,
                                           const core::ValueClassifier& classifier) {
    RedcapValueArray array;
    array.reserve(raw_values.size());
    for (const auto& raw : raw_values) {
        const core::Classification classification = classifier.classify(raw);
        array.numeric_.push_back(classification.numeric_value);
        array.raw_.push_back(raw);
        array.categories_.push_back(classification.category);
    }
    array.checkInvariant();
    return array;
}

RedcapValueArray RedcapValueArray::fromValues(const std::vector<RedcapValue>& values) {
    RedcapValueArray array;
    array.reserve(values.size());
    for (const auto& value : values) {
        array.append(value);
    }
    array.checkInvariant();
    return array;
}

RedcapValueArray RedcapValueArray::concat(const std::vector<RedcapValueArray>& arrays) {
    size_t total = 0;
    for (const auto& array : arrays) {
        total += array.size();
    }

    RedcapValueArray result;
    result.reserve(total);
    for (const auto& array : arrays) {
        result.numeric_.insert(result.numeric_.end(), array.numeric_.begin(), array.numeric_.end());
        result.raw_.insert(result.raw_.end(), array.raw_.begin(), array.raw_.end());
        result.categories_.insert(result.categories_.end(), array.categories_.begin(), array.categories_.end());
    }
    result.checkInvariant();
    return result;
}

RedcapValue RedcapValueArray::at(long long index) const {
    const size_t pos = normalizeIndex(index);
    return RedcapValue(std::make_shared<const core::ValueData>(
        core::ValueData{raw_[pos], numeric_[pos], categories_[pos]}));
}

RedcapValueArray RedcapValueArray::slice(long long start, long long stop) const {
    const long long n = static_cast<long long>(size());
    auto clamp = [n](long long index) {
        if (index < 0) {
            index += n;
        }
        return std::min(std::max(index, 0LL), n);
    };

    const long long begin = clamp(start);
    const long long end = clamp(stop);

    RedcapValueArray result;
    if (end > begin) {
        result.numeric_.assign(numeric_.begin() + begin, numeric_.begin() + end);
        result.raw_.assign(raw_.begin() + begin, raw_.begin() + end);
        result.categories_.assign(categories_.begin() + begin, categories_.begin() + end);
    }
    result.checkInvariant();
    return result;
}

RedcapValueArray RedcapValueArray::take(const std::vector<long long>& indices,
                                        bool allow_fill,
                                        const RedcapValue& fill_value) const {
    RedcapValueArray result;
    result.reserve(indices.size());

    for (long long index : indices) {
        if (allow_fill && index < 0) {
            if (index != -1) {
                RCLOGIC_THROW_ARGS(core::IndexException,
                                   "Only -1 is allowed as a fill index", index, size());
            }
            result.append(fill_value);
            continue;
        }
        result.appendFrom(*this, normalizeIndex(index));
    }

    result.checkInvariant();
    return result;
}

size_t RedcapValueArray::getMemoryUsage() const {
    size_t total = numeric_.capacity() * sizeof(double)
                 + categories_.capacity() * sizeof(ValueCategory)
                 + raw_.capacity() * sizeof(std::string);
    for (const auto& raw : raw_) {
        // 短字符串优化时容量就在对象内部
        if (raw.capacity() > sizeof(std::string)) {
            total += raw.capacity();
        }
    }
    return total;
}

// ========== 比较 ==========

BooleanMask RedcapValueArray::equals(const Operand& other) const {
    return compare(CompareOp::Equal, other);
}

BooleanMask RedcapValueArray::equals(const RedcapValueArray& other) const {
    return compare(CompareOp::Equal, other);
}

BooleanMask RedcapValueArray::equals(const std::vector<Operand>& other) const {
    return compare(CompareOp::Equal, other);
}

BooleanMask RedcapValueArray::compare(CompareOp op, const Operand& other) const {
    const auto right = ValueSemantics::Right::of(other);
    ValueSemantics::requireSupported(right, "comparison");

    BooleanMask result(size());
    for (size_t i = 0; i < size(); ++i) {
        result[i] = ValueSemantics::compare(op, leftAt(i), right);
    }
    return result;
}

BooleanMask RedcapValueArray::compare(CompareOp op, const RedcapValueArray& other) const {
    requireLength(other.size(), "comparison");

    BooleanMask result(size());
    for (size_t i = 0; i < size(); ++i) {
        result[i] = ValueSemantics::compare(op, leftAt(i), other.rightAt(i));
    }
    return result;
}

BooleanMask RedcapValueArray::compare(CompareOp op, const std::vector<Operand>& other) const {
    requireLength(other.size(), "comparison");

    BooleanMask result(size());
    for (size_t i = 0; i < size(); ++i) {
        result[i] = ValueSemantics::compare(op, leftAt(i), ValueSemantics::Right::of(other[i]));
    }
    return result;
}

// ========== 算术 ==========

RedcapValueArray RedcapValueArray::calculate(ArithmeticOp op, const Operand& other) const {
    const auto right = ValueSemantics::Right::of(other);
    ValueSemantics::requireSupported(right, "arithmetic");
    const bool other_missing = other.isMissingValue();

    RedcapValueArray result;
    result.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        const double value = ValueSemantics::calculate(op, leftAt(i), right);
        result.appendCalculated(value, other_missing && categories_[i] == ValueCategory::Missing);
    }
    result.checkInvariant();
    return result;
}

RedcapValueArray RedcapValueArray::calculate(ArithmeticOp op, const RedcapValueArray& other) const {
    requireLength(other.size(), "arithmetic");

    RedcapValueArray result;
    result.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        const double value = ValueSemantics::calculate(op, leftAt(i), other.rightAt(i));
        const bool both_missing = categories_[i] == ValueCategory::Missing &&
                                  other.categories_[i] == ValueCategory::Missing;
        result.appendCalculated(value, both_missing);
    }
    result.checkInvariant();
    return result;
}

RedcapValueArray RedcapValueArray::calculate(ArithmeticOp op, const std::vector<Operand>& other) const {
    requireLength(other.size(), "arithmetic");

    RedcapValueArray result;
    result.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        const double value = ValueSemantics::calculate(op, leftAt(i), ValueSemantics::Right::of(other[i]));
        const bool both_missing = categories_[i] == ValueCategory::Missing && other[i].isMissingValue();
        result.appendCalculated(value, both_missing);
    }
    result.checkInvariant();
    return result;
}

BooleanMask RedcapValueArray::isNa() const {
    BooleanMask result(size());
    for (size_t i = 0; i < size(); ++i) {
        result[i] = std::isnan(numeric_[i]);
    }
    return result;
}

BooleanMask RedcapValueArray::isMissing() const {
    BooleanMask result(size());
    for (size_t i = 0; i < size(); ++i) {
        result[i] = categories_[i] == ValueCategory::Missing;
    }
    return result;
}

// ========== 内部实现 ==========

void RedcapValueArray::checkInvariant() const {
    if (numeric_.size() != raw_.size() || raw_.size() != categories_.size()) {
        RCLOGIC_THROW_ARGS(core::ValueMismatchException,
                           fmt::format("RedcapValueArray parallel arrays out of sync ({} categories)",
                                       categories_.size()),
                           numeric_.size(), raw_.size());
    }
}

void RedcapValueArray::reserve(size_t count) {
    numeric_.reserve(count);
    raw_.reserve(count);
    categories_.reserve(count);
}

void RedcapValueArray::appendFrom(const RedcapValueArray& source, size_t index) {
    numeric_.push_back(source.numeric_[index]);
    raw_.push_back(source.raw_[index]);
    categories_.push_back(source.categories_[index]);
}

void RedcapValueArray::append(const RedcapValue& value) {
    numeric_.push_back(value.numericValue());
    raw_.push_back(value.rawString());
    categories_.push_back(value.category());
}

void RedcapValueArray::appendCalculated(double result, bool stays_missing) {
    // 溢出结果的原始串无法重新分类为 NUMBER，与 NaN 同样处理
    if (!std::isfinite(result)) {
        numeric_.push_back(std::numeric_limits<double>::quiet_NaN());
        raw_.emplace_back(kCalcError);
        categories_.push_back(ValueCategory::Text);
    } else if (stays_missing) {
        numeric_.push_back(0.0);
        raw_.emplace_back();
        categories_.push_back(ValueCategory::Missing);
    } else {
        numeric_.push_back(result);
        raw_.push_back(fmt::format("{}", result));
        categories_.push_back(ValueCategory::Number);
    }
}

size_t RedcapValueArray::normalizeIndex(long long index) const {
    const long long n = static_cast<long long>(size());
    const long long pos = index < 0 ? index + n : index;
    if (pos < 0 || pos >= n) {
        RCLOGIC_THROW_ARGS(core::IndexException, "RedcapValueArray index out of range", index, size());
    }
    return static_cast<size_t>(pos);
}

void RedcapValueArray::requireLength(size_t other_size, const char* operation) const {
    if (other_size != size()) {
        RCLOGIC_THROW_ARGS(core::ValueMismatchException,
                           fmt::format("Element-wise {} requires operands of equal length", operation),
                           size(), other_size);
    }
}

RedcapValueArray makeArray(const std::vector<std::string>& raw_values) {
    return core::ValueFactory::getDefault().makeArray(raw_values);
}

}} // namespace rclogic::columnar
