/**
 * @file Exception.cpp
 * @brief RcLogic异常类实现
 */

#include "Exception.hpp"
#include <fmt/format.h>

namespace rclogic {
namespace core {

// RcLogicException 实现
RcLogicException::RcLogicException(const std::string& message,
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string RcLogicException::getDetailedMessage() const {
    std::string detailed = fmt::format("[{}] {}", getErrorCodeString(), what());

    if (file_ && line_ > 0) {
        detailed += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        detailed += "\nContext:";
        for (const auto& ctx : context_) {
            detailed += fmt::format("\n  - {}", ctx);
        }
    }

    return detailed;
}

void RcLogicException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error RcLogicException::toError() const {
    std::string ctx;
    for (const auto& item : context_) {
        if (!ctx.empty()) {
            ctx += "; ";
        }
        ctx += item;
    }
    return Error(error_code_, what(), ctx);
}

// InputTypeException 实现
InputTypeException::InputTypeException(const std::string& message,
                                       const char* file, int line)
    : RcLogicException(message, ErrorCode::InputTypeError, file, line) {
}

// ParseException 实现
ParseException::ParseException(const std::string& message,
                               size_t offset,
                               const std::string& logic,
                               const char* file, int line)
    : RcLogicException(fmt::format("{} (offset: {})", message, offset),
                       ErrorCode::ParseError, file, line)
    , offset_(offset)
    , logic_(logic) {
    if (!logic_.empty()) {
        addContext(fmt::format("logic: {}", logic_));
    }
}

// ValueMismatchException 实现
ValueMismatchException::ValueMismatchException(const std::string& message,
                                               size_t left_size, size_t right_size,
                                               const char* file, int line)
    : RcLogicException(fmt::format("{} ({} vs {})", message, left_size, right_size),
                       ErrorCode::ValueMismatch, file, line)
    , left_size_(left_size)
    , right_size_(right_size) {
}

// UnknownFieldException 实现
UnknownFieldException::UnknownFieldException(const std::string& message,
                                             const std::string& field_name,
                                             const char* file, int line)
    : RcLogicException(fmt::format("{} (field: {})", message, field_name),
                       ErrorCode::UnknownField, file, line)
    , field_name_(field_name) {
}

// IndexException 实现
IndexException::IndexException(const std::string& message,
                               long long index, size_t size,
                               const char* file, int line)
    : RcLogicException(fmt::format("{} (index: {}, size: {})", message, index, size),
                       ErrorCode::IndexOutOfRange, file, line)
    , index_(index)
    , size_(size) {
}

// ConfigException 实现
ConfigException::ConfigException(const std::string& message,
                                 const char* file, int line)
    : RcLogicException(message, ErrorCode::InvalidConfig, file, line) {
}

void throwError(const Error& error) {
    const std::string message = error.fullMessage();
    switch (error.code) {
        case ErrorCode::InputTypeError:
            throw InputTypeException(message);
        case ErrorCode::ParseError:
            throw ParseException(error.message, 0, error.context);
        case ErrorCode::ValueMismatch:
            throw ValueMismatchException(message);
        case ErrorCode::UnknownField:
            throw UnknownFieldException(error.message, error.context);
        case ErrorCode::IndexOutOfRange:
            throw IndexException(message);
        case ErrorCode::InvalidConfig:
            throw ConfigException(message);
        default:
            throw RcLogicException(message, error.code);
    }
}

} // namespace core
} // namespace rclogic
