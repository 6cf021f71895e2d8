#pragma once

// Small expected<T,E> (subset of C++23 std::expected) for exception-free setup paths:
// argument parsing and sink construction return either a value or an error description.
// No monadic ops, no reference or void value types.

#include <utility>
#include <type_traits>
#include <new>

namespace vcam {

template <class E>
class unexpected {
public:
    static_assert(!std::is_reference_v<E>, "unexpected<E&> not supported");
    constexpr explicit unexpected(const E& e) : error_(e) {}
    constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}
    constexpr const E& error() const & noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }
private:
    E error_;
};

template <class T, class E>
class expected {
public:
    static_assert(!std::is_reference_v<T>, "expected<T&> not supported");
    static_assert(!std::is_reference_v<E>, "expected<E&> not supported");

    expected(const T& v) : has_(true) { ::new (&storage_.value_) T(v); }
    expected(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>) : has_(true) { ::new (&storage_.value_) T(std::move(v)); }

    // Allows returning e.g. a unique_ptr<Derived> where expected<unique_ptr<Base>> is declared.
    template <class U, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, T> &&
                                                std::is_constructible_v<T, U&&> &&
                                                !std::is_same_v<std::decay_t<U>, expected>>>
    expected(U&& v) : has_(true) { ::new (&storage_.value_) T(std::forward<U>(v)); }

    expected(const unexpected<E>& ue) : has_(false) { ::new (&storage_.error_) E(ue.error()); }
    expected(unexpected<E>&& ue) noexcept(std::is_nothrow_move_constructible_v<E>) : has_(false) { ::new (&storage_.error_) E(std::move(ue).error()); }

    expected(const expected& other) : has_(other.has_) {
        if(has_) ::new (&storage_.value_) T(other.storage_.value_);
        else ::new (&storage_.error_) E(other.storage_.error_);
    }
    expected(expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>) : has_(other.has_) {
        if(has_) ::new (&storage_.value_) T(std::move(other.storage_.value_));
        else ::new (&storage_.error_) E(std::move(other.storage_.error_));
    }

    ~expected() { destroy(); }

    expected& operator=(expected rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>) {
        destroy();
        has_ = rhs.has_;
        if(has_) ::new (&storage_.value_) T(std::move(rhs.storage_.value_));
        else ::new (&storage_.error_) E(std::move(rhs.storage_.error_));
        return *this;
    }

    bool has_value() const noexcept { return has_; }
    explicit operator bool() const noexcept { return has_; }

    // Value/error accessors do not check; test has_value() first.
    const T& value() const & { return storage_.value_; }
    T& value() & { return storage_.value_; }
    T&& value() && { return std::move(storage_.value_); }
    const T& operator*() const & { return storage_.value_; }
    T& operator*() & { return storage_.value_; }
    const T* operator->() const { return &storage_.value_; }
    T* operator->() { return &storage_.value_; }

    const E& error() const & { return storage_.error_; }
    E& error() & { return storage_.error_; }

private:
    union Storage { T value_; E error_; Storage(){} ~Storage(){} } storage_;
    bool has_{false};

    void destroy() noexcept {
        if(has_) storage_.value_.~T(); else storage_.error_.~E();
    }
};

template <class E>
unexpected<std::decay_t<E>> make_unexpected(E&& e) { return unexpected<std::decay_t<E>>(std::forward<E>(e)); }

} // namespace vcam
