#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace rclogic {
namespace core {

/**
 * @brief RcLogic统一错误码
 *
 * - 结构性错误（类型、长度、语法）立即上报
 * - 值域内的语义边界（无法解析的数字、除零、文本与数字比较）
 *   不走错误码，而是退化为 NaN / false
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,

    // 值与数组操作 (20-39)
    InputTypeError = 20,
    ValueMismatch = 21,
    IndexOutOfRange = 22,

    // 分支逻辑 (40-59)
    ParseError = 40,
    UnknownField = 41,

    // 配置 (60-69)
    InvalidConfig = 60
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息，如出错的逻辑串

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码的枚举名（用于日志与异常详情）
 */
const char* codeName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 按错误码抛出对应的异常类型（实现在 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace rclogic::core
