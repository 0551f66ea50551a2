#include "rclogic/core/ValueClassifier.hpp"
#include "rclogic/utils/DateTimeUtils.hpp"
#include "rclogic/utils/ModuleLoggers.hpp"

#include <fast_float/fast_float.h>
#include <cmath>
#include <limits>
#include <string>
#include <system_error>

namespace rclogic {
namespace core {

ValueClassifier::ValueClassifier(ClassifierConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

std::optional<double> ValueClassifier::parseNumber(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();

    // fast_float 不接受前导 '+'，这里手动跳过
    const char* body = first;
    if (*first == '+') {
        ++first;
        body = first;
    } else if (*first == '-') {
        body = first + 1;
    }

    // 符号之后必须是数字或小数点，从而排除 inf/nan、重复符号和空白
    if (body == last) {
        return std::nullopt;
    }
    const char lead = *body;
    if (!(lead == '.' || (lead >= '0' && lead <= '9'))) {
        return std::nullopt;
    }

    double value = 0.0;
    auto result = fast_float::from_chars(first, last, value);
    if (result.ec != std::errc{} || result.ptr != last) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool ValueClassifier::isMissingCode(std::string_view raw) const {
    if (config_.missing_codes.empty()) {
        return false;
    }
    return config_.missing_codes.count(std::string(raw)) > 0;
}

std::optional<size_t> ValueClassifier::matchDateFormat(std::string_view raw) const {
    for (size_t i = 0; i < config_.date_formats.size(); ++i) {
        if (utils::DateTimeUtils::matchesFormat(raw, config_.date_formats[i])) {
            return i;
        }
    }
    return std::nullopt;
}

Classification ValueClassifier::classify(std::string_view raw) const {
    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    if (raw.empty()) {
        return {ValueCategory::Missing, 0.0};
    }

    // 缺失代码必须先于数字解析判定，例如 "-99" 被配置为缺失代码时不能再算作数字
    if (isMissingCode(raw)) {
        RCLOGIC_LOG_CLASSIFIER_DEBUG("'{}' classified as missing-data code", raw);
        return {ValueCategory::Code, kNaN};
    }

    if (auto number = parseNumber(raw)) {
        return {ValueCategory::Number, *number};
    }

    if (auto format_index = matchDateFormat(raw)) {
        RCLOGIC_LOG_CLASSIFIER_DEBUG("'{}' matched date format '{}'", raw,
                                     config_.date_formats[*format_index]);
        return {ValueCategory::Date, kNaN};
    }

    return {ValueCategory::Text, kNaN};
}

}} // namespace rclogic::core
