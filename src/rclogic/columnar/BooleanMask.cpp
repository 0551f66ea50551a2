#include "rclogic/columnar/BooleanMask.hpp"
#include "rclogic/core/Exception.hpp"

#include <algorithm>

namespace rclogic {
namespace columnar {

namespace {

void requireSameLength(const BooleanMask& lhs, const BooleanMask& rhs) {
    if (lhs.size() != rhs.size()) {
        RCLOGIC_THROW_ARGS(core::ValueMismatchException,
                           "Boolean masks must have equal length", lhs.size(), rhs.size());
    }
}

} // namespace

BooleanMask maskAnd(const BooleanMask& lhs, const BooleanMask& rhs) {
    requireSameLength(lhs, rhs);
    BooleanMask result(lhs.size());
    for (size_t i = 0; i < lhs.size(); ++i) {
        result[i] = lhs[i] && rhs[i];
    }
    return result;
}

BooleanMask maskOr(const BooleanMask& lhs, const BooleanMask& rhs) {
    requireSameLength(lhs, rhs);
    BooleanMask result(lhs.size());
    for (size_t i = 0; i < lhs.size(); ++i) {
        result[i] = lhs[i] || rhs[i];
    }
    return result;
}

BooleanMask maskNot(const BooleanMask& mask) {
    BooleanMask result(mask);
    result.flip();
    return result;
}

size_t countTrue(const BooleanMask& mask) {
    return static_cast<size_t>(std::count(mask.begin(), mask.end(), true));
}

std::vector<size_t> maskToIndices(const BooleanMask& mask) {
    std::vector<size_t> indices;
    indices.reserve(countTrue(mask));
    for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) {
            indices.push_back(i);
        }
    }
    return indices;
}

}} // namespace rclogic::columnar
