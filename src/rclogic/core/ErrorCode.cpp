#include "rclogic/core/ErrorCode.hpp"

namespace rclogic {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        case ErrorCode::InputTypeError:
            return "Unsupported operand type";
        case ErrorCode::ValueMismatch:
            return "Operand lengths do not match";
        case ErrorCode::IndexOutOfRange:
            return "Index out of range";

        case ErrorCode::ParseError:
            return "Malformed branching logic";
        case ErrorCode::UnknownField:
            return "Unknown field";

        case ErrorCode::InvalidConfig:
            return "Invalid configuration";

        default:
            return "Unknown error";
    }
}

const char* codeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::InputTypeError: return "InputTypeError";
        case ErrorCode::ValueMismatch: return "ValueMismatch";
        case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::UnknownField: return "UnknownField";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        default: return "Unknown";
    }
}

}} // namespace rclogic::core
