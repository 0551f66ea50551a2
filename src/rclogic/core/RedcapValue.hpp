#pragma once

#include "rclogic/core/ValueCategory.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace rclogic {
namespace core {

struct Classification;
class Operand;

/**
 * @brief 比较运算符
 */
enum class CompareOp : uint8_t {
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual
};

/**
 * @brief 算术运算符
 */
enum class ArithmeticOp : uint8_t {
    Add,
    Sub,
    Mul,
    Div
};

const char* toString(CompareOp op) noexcept;
const char* toString(ArithmeticOp op) noexcept;

/**
 * @brief 由三路比较结果求出有序比较的真值（Equal/NotEqual 也适用）
 */
bool orderingHolds(CompareOp op, int three_way) noexcept;

/**
 * @brief 对两个 double 应用算术运算，除数为0时返回 NaN
 */
double applyArithmetic(ArithmeticOp op, double lhs, double rhs) noexcept;

/**
 * @brief 值的不可变存储，多个 RedcapValue 可共享同一份
 */
struct ValueData {
    std::string raw;
    double numeric;
    ValueCategory category;
};

/**
 * @brief 单个响应值
 *
 * 原始字符串永远保留；数值与类别在构造时由分类器确定。
 * 相等性按值判定，与是否驻留无关。
 *
 * 比较语义（按类别分派）：
 * - 与值/字符串比较：相等为原始字符串完全一致，大小为按字节的字典序
 * - 与数字比较：使用数值；文本族（Text/Date/Code）恒为 false
 *
 * 算术语义：两侧都转为数值，返回 double；文本族与无法解析的字符串
 * 得到 NaN，Missing 按 0.0 参与，除以0得到 NaN。
 */
class RedcapValue {
public:
    /**
     * @brief 构造 Missing 值（原始串 ""，数值 0.0）
     */
    RedcapValue();

    RedcapValue(std::string raw, const Classification& classification);

    explicit RedcapValue(std::shared_ptr<const ValueData> data);

    static RedcapValue missing();

    const std::string& rawString() const noexcept { return data_->raw; }
    double numericValue() const noexcept { return data_->numeric; }
    ValueCategory category() const noexcept { return data_->category; }

    bool isMissing() const noexcept { return data_->category == ValueCategory::Missing; }
    bool isNumber() const noexcept { return data_->category == ValueCategory::Number; }
    bool isTextLike() const noexcept { return isTextFamily(data_->category); }
    bool isNa() const noexcept;

    // 比较
    bool equals(const Operand& other) const;
    bool compare(CompareOp op, const Operand& other) const;
    bool lessThan(const Operand& other) const;
    bool lessEqual(const Operand& other) const;
    bool greaterThan(const Operand& other) const;
    bool greaterEqual(const Operand& other) const;

    // 算术
    double calculate(ArithmeticOp op, const Operand& other) const;
    double add(const Operand& other) const;
    double sub(const Operand& other) const;
    double mul(const Operand& other) const;
    double div(const Operand& other) const;

    /**
     * @brief 调试输出：RedcapValue(raw='…', numeric=…, category=…)
     */
    std::string toDebugString() const;

    /**
     * @brief 是否与另一个值共享同一份存储（驻留命中）
     */
    bool sharesStorageWith(const RedcapValue& other) const noexcept {
        return data_ == other.data_;
    }

private:
    std::shared_ptr<const ValueData> data_;
};

/**
 * @brief 比较/算术的右操作数
 *
 * 可以是另一个值、字符串、数字，或 None（不支持的类型，使用时抛出
 * InputTypeException）。布尔值不是合法操作数。
 */
class Operand {
public:
    enum class Kind : uint8_t {
        None,
        Value,
        String,
        Number
    };

    Operand() = default;

    Operand(const RedcapValue& value) : kind_(Kind::Value), value_(value) {}
    Operand(std::string text) : kind_(Kind::String), text_(std::move(text)) {}
    Operand(std::string_view text) : kind_(Kind::String), text_(text) {}
    Operand(const char* text) : kind_(Kind::String), text_(text ? text : "") {}
    Operand(double number) : kind_(Kind::Number), number_(number) {}
    Operand(int number) : kind_(Kind::Number), number_(number) {}
    Operand(long number) : kind_(Kind::Number), number_(static_cast<double>(number)) {}
    Operand(long long number) : kind_(Kind::Number), number_(static_cast<double>(number)) {}
    Operand(bool) = delete;

    static Operand none() { return Operand(); }

    Kind kind() const noexcept { return kind_; }
    bool isNone() const noexcept { return kind_ == Kind::None; }
    bool isValue() const noexcept { return kind_ == Kind::Value; }
    bool isString() const noexcept { return kind_ == Kind::String; }
    bool isNumber() const noexcept { return kind_ == Kind::Number; }

    const RedcapValue& value() const noexcept { return value_; }
    const std::string& text() const noexcept { return text_; }
    double number() const noexcept { return number_; }

    /**
     * @brief 参与数组算术时是否视为 Missing（仅 Missing 值本身）
     */
    bool isMissingValue() const noexcept {
        return kind_ == Kind::Value && value_.isMissing();
    }

private:
    Kind kind_ = Kind::None;
    RedcapValue value_;
    std::string text_;
    double number_ = 0.0;
};

/**
 * @brief 值语义的无状态实现
 *
 * 标量 RedcapValue 与列式数组共用同一张真值表；数组直接用列中的
 * (原始串, 数值, 类别) 组装 Left/Right，不必为每个元素构造 RedcapValue。
 */
class ValueSemantics {
public:
    struct Left {
        std::string_view raw;
        double numeric;
        ValueCategory category;
    };

    struct Right {
        Operand::Kind kind;
        std::string_view text;  // Value 的原始串或 String 的内容
        double number;          // Value 的数值或 Number 本身
        ValueCategory category; // 仅 Value 有意义

        static Right of(const Operand& operand);
        static Right ofValue(std::string_view raw, double numeric, ValueCategory category) {
            return Right{Operand::Kind::Value, raw, numeric, category};
        }
    };

    static bool equals(const Left& left, const Right& right);
    static bool compare(CompareOp op, const Left& left, const Right& right);
    static double calculate(ArithmeticOp op, const Left& left, const Right& right);

    /**
     * @brief None 操作数统一在这里拒绝
     */
    static void requireSupported(const Right& right, const char* operation);
};

// 运算符转发到显式接口
inline bool operator==(const RedcapValue& lhs, const Operand& rhs) { return lhs.equals(rhs); }
inline bool operator!=(const RedcapValue& lhs, const Operand& rhs) { return !lhs.equals(rhs); }
inline bool operator<(const RedcapValue& lhs, const Operand& rhs) { return lhs.lessThan(rhs); }
inline bool operator<=(const RedcapValue& lhs, const Operand& rhs) { return lhs.lessEqual(rhs); }
inline bool operator>(const RedcapValue& lhs, const Operand& rhs) { return lhs.greaterThan(rhs); }
inline bool operator>=(const RedcapValue& lhs, const Operand& rhs) { return lhs.greaterEqual(rhs); }

inline bool operator==(const RedcapValue& lhs, const RedcapValue& rhs) { return lhs.equals(Operand(rhs)); }
inline bool operator!=(const RedcapValue& lhs, const RedcapValue& rhs) { return !lhs.equals(Operand(rhs)); }

inline double operator+(const RedcapValue& lhs, const Operand& rhs) { return lhs.add(rhs); }
inline double operator-(const RedcapValue& lhs, const Operand& rhs) { return lhs.sub(rhs); }
inline double operator*(const RedcapValue& lhs, const Operand& rhs) { return lhs.mul(rhs); }
inline double operator/(const RedcapValue& lhs, const Operand& rhs) { return lhs.div(rhs); }

std::ostream& operator<<(std::ostream& os, const RedcapValue& value);

}} // namespace rclogic::core

namespace std {

template<>
struct hash<rclogic::core::RedcapValue> {
    size_t operator()(const rclogic::core::RedcapValue& value) const noexcept {
        return std::hash<std::string>()(value.rawString());
    }
};

// 哈希容器按原始串判等，与 hash 保持一致
template<>
struct equal_to<rclogic::core::RedcapValue> {
    bool operator()(const rclogic::core::RedcapValue& lhs, const rclogic::core::RedcapValue& rhs) const noexcept {
        return lhs.rawString() == rhs.rawString();
    }
};

} // namespace std
