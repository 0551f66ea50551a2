#pragma once

#include "rclogic/columnar/BooleanMask.hpp"
#include "rclogic/core/RedcapValue.hpp"
#include "rclogic/core/ValueCategory.hpp"

#include <string>
#include <vector>
#include <cstddef>

namespace rclogic {
namespace core {
class ValueClassifier;
}

namespace columnar {

/**
 * @brief 响应值的列式数组
 *
 * 三个等长的并行数组（数值、原始串、类别），每次变更后校验长度一致。
 * 语义与标量 RedcapValue 相同，只是逐元素执行；所有操作都返回新数组。
 *
 * 操作数有三种形态：
 * - 标量 Operand：广播到每个元素
 * - 等长 RedcapValueArray：逐元素作为值操作数
 * - 等长 std::vector<Operand>：逐元素按各自的类型分派
 */
class RedcapValueArray {
public:
    static constexpr const char* kCalcError = "$$CALC_ERR";

    RedcapValueArray() = default;

    /**
     * @brief 由三个并行数组构造，长度不一致时抛出 ValueMismatchException
     */
    RedcapValueArray(std::vector<double> numeric_values,
                     std::vector<std::string> raw_values,
                     std::vector<core::ValueCategory> categories);

    static RedcapValueArray fromRaw(const std::vector<std::string>& raw_values,
                                    const core::ValueClassifier& classifier);

    static RedcapValueArray fromValues(const std::vector<core::RedcapValue>& values);

    /**
     * @brief 按顺序拼接
     */
    static RedcapValueArray concat(const std::vector<RedcapValueArray>& arrays);

    size_t size() const noexcept { return raw_.size(); }
    bool empty() const noexcept { return raw_.empty(); }

    /**
     * @brief 按位置取值，负数从末尾计数，越界抛出 IndexException
     */
    core::RedcapValue at(long long index) const;

    /**
     * @brief Python 风格切片 [start, stop)，负数从末尾计数，越界自动截断
     */
    RedcapValueArray slice(long long start, long long stop) const;

    /**
     * @brief 按下标取元素
     * @param indices 下标序列
     * @param allow_fill 为 true 时 -1 表示填充值，其他负数非法；
     *                   为 false 时负数从末尾计数
     * @param fill_value 填充值，默认 Missing
     */
    RedcapValueArray take(const std::vector<long long>& indices,
                          bool allow_fill = false,
                          const core::RedcapValue& fill_value = core::RedcapValue()) const;

    RedcapValueArray copy() const { return *this; }

    size_t getMemoryUsage() const;

    // 比较
    BooleanMask equals(const core::Operand& other) const;
    BooleanMask equals(const RedcapValueArray& other) const;
    BooleanMask equals(const std::vector<core::Operand>& other) const;

    BooleanMask compare(core::CompareOp op, const core::Operand& other) const;
    BooleanMask compare(core::CompareOp op, const RedcapValueArray& other) const;
    BooleanMask compare(core::CompareOp op, const std::vector<core::Operand>& other) const;

    // 算术
    RedcapValueArray calculate(core::ArithmeticOp op, const core::Operand& other) const;
    RedcapValueArray calculate(core::ArithmeticOp op, const RedcapValueArray& other) const;
    RedcapValueArray calculate(core::ArithmeticOp op, const std::vector<core::Operand>& other) const;

    template<typename Other>
    RedcapValueArray add(const Other& other) const { return calculate(core::ArithmeticOp::Add, other); }
    template<typename Other>
    RedcapValueArray sub(const Other& other) const { return calculate(core::ArithmeticOp::Sub, other); }
    template<typename Other>
    RedcapValueArray mul(const Other& other) const { return calculate(core::ArithmeticOp::Mul, other); }
    template<typename Other>
    RedcapValueArray div(const Other& other) const { return calculate(core::ArithmeticOp::Div, other); }

    BooleanMask isNa() const;
    BooleanMask isMissing() const;

    const std::vector<double>& numericValues() const noexcept { return numeric_; }
    const std::vector<std::string>& rawStrings() const noexcept { return raw_; }
    const std::vector<core::ValueCategory>& categories() const noexcept { return categories_; }

private:
    std::vector<double> numeric_;
    std::vector<std::string> raw_;
    std::vector<core::ValueCategory> categories_;

    void checkInvariant() const;
    void reserve(size_t count);
    void appendFrom(const RedcapValueArray& source, size_t index);
    void append(const core::RedcapValue& value);
    void appendCalculated(double result, bool stays_missing);

    core::ValueSemantics::Left leftAt(size_t index) const {
        return core::ValueSemantics::Left{raw_[index], numeric_[index], categories_[index]};
    }
    core::ValueSemantics::Right rightAt(size_t index) const {
        return core::ValueSemantics::Right::ofValue(raw_[index], numeric_[index], categories_[index]);
    }

    size_t normalizeIndex(long long index) const;
    void requireLength(size_t other_size, const char* operation) const;
};

/**
 * @brief 使用默认工厂的分类配置构造数组
 */
RedcapValueArray makeArray(const std::vector<std::string>& raw_values);

}} // namespace rclogic::columnar
