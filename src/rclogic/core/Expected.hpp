#pragma once

#include "rclogic/core/ErrorCode.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace rclogic {
namespace core {

/**
 * @brief Expected<T, E> - 不抛异常的返回通道
 *
 * 与 std::expected (C++23) 语义相近：要么持有成功值，要么持有错误。
 * 用于 tryTranslate 等不希望抛异常的接口；需要异常时调用 valueOrThrow()。
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    template<typename Other>
    void constructFrom(Other&& other) {
        has_value_ = other.has_value_;
        if (has_value_) {
            new(&value_) T(std::forward<Other>(other).value_);
        } else {
            new(&error_) E(std::forward<Other>(other).error_);
        }
    }

    [[noreturn]] void raise() const {
        if constexpr (std::is_same_v<E, Error>) {
            throwError(error_);
        } else {
            throw error_;
        }
    }

public:
    using value_type = T;
    using error_type = E;

    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) {
        constructFrom(other);
    }

    Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                        std::is_nothrow_move_constructible_v<E>) {
        constructFrom(std::move(other));
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            constructFrom(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                   std::is_nothrow_move_constructible_v<E>) {
        if (this != &other) {
            destroy();
            constructFrom(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // 不做检查，调用前先判断 hasValue()
    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }

    T valueOr(T default_value) const & {
        return has_value_ ? value_ : std::move(default_value);
    }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    /**
     * @brief 成功时对值做变换，失败时原样传递错误
     */
    template<typename F>
    auto map(F&& func) const -> Expected<std::decay_t<decltype(func(value_))>, E> {
        using U = std::decay_t<decltype(func(value_))>;
        if (has_value_) {
            return Expected<U, E>(func(value_));
        }
        return Expected<U, E>(error_);
    }

    /**
     * @brief 链式调用：func 自身返回 Expected
     */
    template<typename F>
    auto andThen(F&& func) const -> decltype(func(value_)) {
        if (has_value_) {
            return func(value_);
        }
        return decltype(func(value_))(error_);
    }

    const T& valueOrThrow() const & {
        if (!has_value_) {
            raise();
        }
        return value_;
    }

    T valueOrThrow() && {
        if (!has_value_) {
            raise();
        }
        return std::move(value_);
    }
};

/**
 * @brief void 特化：只关心成功与否
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : has_value_(true) {}
    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    const E& error() const & noexcept { return error_; }

    void valueOrThrow() const {
        if (has_value_) {
            return;
        }
        if constexpr (std::is_same_v<E, Error>) {
            throwError(error_);
        } else {
            throw error_;
        }
    }
};

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

}} // namespace rclogic::core
