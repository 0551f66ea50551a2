/**
 * @file Exception.hpp
 * @brief RcLogic异常类定义
 */

#ifndef RCLOGIC_EXCEPTION_HPP
#define RCLOGIC_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>
#include "ErrorCode.hpp"

namespace rclogic {
namespace core {

/**
 * @brief RcLogic基础异常类
 */
class RcLogicException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    RcLogicException(const std::string& message,
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return codeName(error_code_); }

    /**
     * @brief 获取详细错误信息（错误码、抛出位置、上下文链）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为 Error 值，供 Result 通道使用
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 不支持的操作数类型
 */
class InputTypeException : public RcLogicException {
public:
    InputTypeException(const std::string& message,
                       const char* file = nullptr, int line = 0);
};

/**
 * @brief 分支逻辑语法错误
 */
class ParseException : public RcLogicException {
public:
    ParseException(const std::string& message,
                   size_t offset = 0,
                   const std::string& logic = "",
                   const char* file = nullptr, int line = 0);

    /**
     * @brief 出错位置（预处理后字符串中的0基偏移）
     */
    size_t getOffset() const noexcept { return offset_; }
    const std::string& getLogic() const { return logic_; }

private:
    size_t offset_;
    std::string logic_;
};

/**
 * @brief 批量操作的两侧长度不一致
 */
class ValueMismatchException : public RcLogicException {
public:
    ValueMismatchException(const std::string& message,
                           size_t left_size = 0, size_t right_size = 0,
                           const char* file = nullptr, int line = 0);

    size_t getLeftSize() const noexcept { return left_size_; }
    size_t getRightSize() const noexcept { return right_size_; }

private:
    size_t left_size_;
    size_t right_size_;
};

/**
 * @brief 谓词引用了数据表中不存在的字段
 */
class UnknownFieldException : public RcLogicException {
public:
    UnknownFieldException(const std::string& message,
                          const std::string& field_name = "",
                          const char* file = nullptr, int line = 0);

    const std::string& getFieldName() const { return field_name_; }

private:
    std::string field_name_;
};

/**
 * @brief 位置索引越界
 */
class IndexException : public RcLogicException {
public:
    IndexException(const std::string& message,
                   long long index = 0, size_t size = 0,
                   const char* file = nullptr, int line = 0);

    long long getIndex() const noexcept { return index_; }
    size_t getSize() const noexcept { return size_; }

private:
    long long index_;
    size_t size_;
};

/**
 * @brief 配置非法（日期格式指令、重复列名等）
 */
class ConfigException : public RcLogicException {
public:
    ConfigException(const std::string& message,
                    const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace rclogic

// 便捷宏定义
#define RCLOGIC_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__)

#define RCLOGIC_THROW_ARGS(ExceptionType, message, ...) \
    throw ExceptionType(message, __VA_ARGS__, __FILE__, __LINE__)

#define RCLOGIC_THROW_IF(condition, ExceptionType, message) \
    do { if (condition) { RCLOGIC_THROW(ExceptionType, message); } } while(0)

#endif // RCLOGIC_EXCEPTION_HPP
