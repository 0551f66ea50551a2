#pragma once

#include <vector>
#include <cstddef>

namespace rclogic {
namespace columnar {

// 行掩码：第 i 个元素表示第 i 行是否满足条件
using BooleanMask = std::vector<bool>;

/**
 * @brief 逐元素与，长度不一致时抛出 ValueMismatchException
 */
BooleanMask maskAnd(const BooleanMask& lhs, const BooleanMask& rhs);

/**
 * @brief 逐元素或，长度不一致时抛出 ValueMismatchException
 */
BooleanMask maskOr(const BooleanMask& lhs, const BooleanMask& rhs);

BooleanMask maskNot(const BooleanMask& mask);

size_t countTrue(const BooleanMask& mask);

/**
 * @brief 为 true 的行号，升序
 */
std::vector<size_t> maskToIndices(const BooleanMask& mask);

}} // namespace rclogic::columnar
