#include "rclogic/core/RedcapValue.hpp"
#include "rclogic/core/ValueClassifier.hpp"
#include "rclogic/core/Exception.hpp"

#include <fmt/format.h>
#include <cmath>
#include <limits>

namespace rclogic {
namespace core {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const std::shared_ptr<const ValueData>& missingData() {
    static const std::shared_ptr<const ValueData> data =
        std::make_shared<const ValueData>(ValueData{std::string(), 0.0, ValueCategory::Missing});
    return data;
}

[[noreturn]] void throwUnsupported(const char* operation) {
    RCLOGIC_THROW(InputTypeException,
                  fmt::format("Unsupported operand type for RedcapValue {}", operation));
}

ValueSemantics::Left leftOf(const ValueData& data) {
    return ValueSemantics::Left{data.raw, data.numeric, data.category};
}

} // namespace

const char* toString(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::Equal:        return "=";
        case CompareOp::NotEqual:     return "<>";
        case CompareOp::Less:         return "<";
        case CompareOp::LessEqual:    return "<=";
        case CompareOp::Greater:      return ">";
        case CompareOp::GreaterEqual: return ">=";
        default:                      return "?";
    }
}

const char* toString(ArithmeticOp op) noexcept {
    switch (op) {
        case ArithmeticOp::Add: return "+";
        case ArithmeticOp::Sub: return "-";
        case ArithmeticOp::Mul: return "*";
        case ArithmeticOp::Div: return "/";
        default:                return "?";
    }
}

bool orderingHolds(CompareOp op, int three_way) noexcept {
    switch (op) {
        case CompareOp::Equal:        return three_way == 0;
        case CompareOp::NotEqual:     return three_way != 0;
        case CompareOp::Less:         return three_way < 0;
        case CompareOp::LessEqual:    return three_way <= 0;
        case CompareOp::Greater:      return three_way > 0;
        case CompareOp::GreaterEqual: return three_way >= 0;
        default:                      return false;
    }
}

double applyArithmetic(ArithmeticOp op, double lhs, double rhs) noexcept {
    switch (op) {
        case ArithmeticOp::Add: return lhs + rhs;
        case ArithmeticOp::Sub: return lhs - rhs;
        case ArithmeticOp::Mul: return lhs * rhs;
        case ArithmeticOp::Div:
            if (rhs == 0.0) {
                return kNaN;
            }
            return lhs / rhs;
        default:
            return kNaN;
    }
}

// ========== RedcapValue ==========

RedcapValue::RedcapValue()
    : data_(missingData()) {
}

RedcapValue::RedcapValue(std::string raw, const Classification& classification)
    : data_(std::make_shared<const ValueData>(
          ValueData{std::move(raw), classification.numeric_value, classification.category})) {
}

RedcapValue::RedcapValue(std::shared_ptr<const ValueData> data)
    : data_(data ? std::move(data) : missingData()) {
}

RedcapValue RedcapValue::missing() {
    return RedcapValue();
}

bool RedcapValue::isNa() const noexcept {
    return std::isnan(data_->numeric);
}

bool RedcapValue::equals(const Operand& other) const {
    return ValueSemantics::equals(leftOf(*data_), ValueSemantics::Right::of(other));
}

bool RedcapValue::compare(CompareOp op, const Operand& other) const {
    return ValueSemantics::compare(op, leftOf(*data_), ValueSemantics::Right::of(other));
}

bool RedcapValue::lessThan(const Operand& other) const {
    return compare(CompareOp::Less, other);
}

bool RedcapValue::lessEqual(const Operand& other) const {
    return compare(CompareOp::LessEqual, other);
}

bool RedcapValue::greaterThan(const Operand& other) const {
    return compare(CompareOp::Greater, other);
}

bool RedcapValue::greaterEqual(const Operand& other) const {
    return compare(CompareOp::GreaterEqual, other);
}

double RedcapValue::calculate(ArithmeticOp op, const Operand& other) const {
    return ValueSemantics::calculate(op, leftOf(*data_), ValueSemantics::Right::of(other));
}

double RedcapValue::add(const Operand& other) const {
    return calculate(ArithmeticOp::Add, other);
}

double RedcapValue::sub(const Operand& other) const {
    return calculate(ArithmeticOp::Sub, other);
}

double RedcapValue::mul(const Operand& other) const {
    return calculate(ArithmeticOp::Mul, other);
}

double RedcapValue::div(const Operand& other) const {
    return calculate(ArithmeticOp::Div, other);
}

std::string RedcapValue::toDebugString() const {
    return fmt::format("RedcapValue(raw='{}', numeric={}, category={})",
                       data_->raw, data_->numeric, toString(data_->category));
}

std::ostream& operator<<(std::ostream& os, const RedcapValue& value) {
    return os << value.rawString();
}

// ========== ValueSemantics ==========

ValueSemantics::Right ValueSemantics::Right::of(const Operand& operand) {
    switch (operand.kind()) {
        case Operand::Kind::Value: {
            const RedcapValue& value = operand.value();
            return ofValue(value.rawString(), value.numericValue(), value.category());
        }
        case Operand::Kind::String:
            return Right{Operand::Kind::String, operand.text(), kNaN, ValueCategory::Text};
        case Operand::Kind::Number:
            return Right{Operand::Kind::Number, std::string_view(), operand.number(), ValueCategory::Number};
        case Operand::Kind::None:
        default:
            return Right{Operand::Kind::None, std::string_view(), kNaN, ValueCategory::Text};
    }
}

void ValueSemantics::requireSupported(const Right& right, const char* operation) {
    if (right.kind == Operand::Kind::None) {
        throwUnsupported(operation);
    }
}

bool ValueSemantics::equals(const Left& left, const Right& right) {
    switch (right.kind) {
        case Operand::Kind::Value:
            // Missing 与值比较时，对方为 Missing 或数值为 0 也视为相等
            if (left.category == ValueCategory::Missing) {
                return right.category == ValueCategory::Missing ||
                       right.text.empty() ||
                       (!isTextFamily(right.category) && right.number == 0.0);
            }
            return left.raw == right.text;

        case Operand::Kind::String:
            // 与字符串比较只看原始串，从不转为数字；
            // Missing 的原始串为 ""，因此等于 ""，但不等于 "0"
            return left.raw == right.text;

        case Operand::Kind::Number:
            switch (left.category) {
                case ValueCategory::Missing:
                case ValueCategory::Number:
                    return left.numeric == right.number;
                case ValueCategory::Text:
                case ValueCategory::Date:
                case ValueCategory::Code:
                default:
                    return false;
            }

        case Operand::Kind::None:
        default:
            throwUnsupported("comparison");
    }
}

bool ValueSemantics::compare(CompareOp op, const Left& left, const Right& right) {
    if (op == CompareOp::Equal) {
        return equals(left, right);
    }
    if (op == CompareOp::NotEqual) {
        return !equals(left, right);
    }

    switch (right.kind) {
        case Operand::Kind::Value:
        case Operand::Kind::String: {
            // 按字节的字典序，"13" < "13.0"
            const int result = left.raw.compare(right.text);
            return orderingHolds(op, result < 0 ? -1 : (result > 0 ? 1 : 0));
        }

        case Operand::Kind::Number: {
            if (isTextFamily(left.category) || std::isnan(right.number)) {
                return false;
            }
            const double lhs = left.numeric;
            const double rhs = right.number;
            return orderingHolds(op, lhs < rhs ? -1 : (lhs > rhs ? 1 : 0));
        }

        case Operand::Kind::None:
        default:
            throwUnsupported("comparison");
    }
}

double ValueSemantics::calculate(ArithmeticOp op, const Left& left, const Right& right) {
    double rhs = kNaN;
    switch (right.kind) {
        case Operand::Kind::Value:
        case Operand::Kind::Number:
            rhs = right.number;
            break;
        case Operand::Kind::String: {
            auto parsed = ValueClassifier::parseNumber(right.text);
            rhs = parsed ? *parsed : kNaN;
            break;
        }
        case Operand::Kind::None:
        default:
            throwUnsupported("arithmetic");
    }

    switch (left.category) {
        case ValueCategory::Missing:
        case ValueCategory::Number:
            return applyArithmetic(op, left.numeric, rhs);
        case ValueCategory::Text:
        case ValueCategory::Date:
        case ValueCategory::Code:
        default:
            return kNaN;
    }
}

}} // namespace rclogic::core
