#pragma once

#include "sheetlink/core/ErrorCode.hpp"
#include "sheetlink/core/Exception.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace sheetlink {
namespace core {

/**
 * @brief Expected<T, E> - 成功值或错误的判别联合
 *
 * 类似于std::expected (C++23)：
 * - 内部各层（读取、写出、校验）通过返回值传递错误
 * - 只有对外边界把错误整理成结果记录，不向调用方抛异常
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

public:
    using value_type = T;
    using error_type = E;

    // ========== 构造函数 ==========

    Expected() : has_value_(true) {
        new(&value_) T{};
    }

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

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    // ========== 赋值操作符 ==========

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(other.value_);
            } else {
                new(&error_) E(other.error_);
            }
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(std::move(other.value_));
            } else {
                new(&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // ========== 状态检查 ==========

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问 ==========

    /**
     * @brief 获取值（不检查）
     */
    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    /**
     * @brief 获取错误（不检查）
     */
    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }
    T&& operator*() && noexcept { return std::move(value_); }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    /**
     * @brief 取值，失败时抛出异常
     */
    const T& valueOrThrow() const & {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw E(error_);
            }
        }
        return value_;
    }

    T valueOrThrow() && {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw E(std::move(error_));
            }
        }
        return std::move(value_);
    }

private:
    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }
};

/**
 * @brief 特化：void类型的Expected
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

    explicit operator bool() const noexcept { return has_value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }

    void valueOrThrow() const {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw E(error_);
            }
        }
    }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

}} // namespace sheetlink::core
