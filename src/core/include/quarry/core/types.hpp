#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace quarry {

// ============================================================================
// Basic type aliases
// ============================================================================

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Result type - For error handling without exceptions
// ============================================================================

template<typename E>
struct Error {
    E value;

    explicit Error(E e) : value(std::move(e)) {}
};

template<typename E>
Error<std::decay_t<E>> make_error(E&& e) {
    return Error<std::decay_t<E>>(std::forward<E>(e));
}

template<typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                         !std::is_same_v<std::decay_t<U>, Error<E>>>>
    Result(U&& value) : m_data(std::in_place_index<0>, std::forward<U>(value)) {}
    Result(Error<E> error) : m_data(std::in_place_index<1>, std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_data.index() == 1; }

    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_data); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_data); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_data); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(m_data)); }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(m_data);
        }
        return default_value;
    }

private:
    std::variant<T, E> m_data;
};

// ============================================================================
// RefPtr - Reference counted smart pointer (thread-safe)
// ============================================================================

template<typename T>
class RefPtr {
public:
    RefPtr() noexcept : m_ptr(nullptr) {}
    RefPtr(std::nullptr_t) noexcept : m_ptr(nullptr) {}

    explicit RefPtr(T* ptr) : m_ptr(ptr) {
        if (m_ptr) {
            m_ptr->add_ref();
        }
    }

    RefPtr(const RefPtr& other) noexcept : m_ptr(other.m_ptr) {
        if (m_ptr) {
            m_ptr->add_ref();
        }
    }

    RefPtr(RefPtr&& other) noexcept : m_ptr(other.m_ptr) {
        other.m_ptr = nullptr;
    }

    template<typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    RefPtr(const RefPtr<U>& other) noexcept : m_ptr(other.get()) {
        if (m_ptr) {
            m_ptr->add_ref();
        }
    }

    ~RefPtr() {
        if (m_ptr) {
            m_ptr->release();
        }
    }

    RefPtr& operator=(const RefPtr& other) noexcept {
        if (this != &other) {
            if (other.m_ptr) {
                other.m_ptr->add_ref();
            }
            if (m_ptr) {
                m_ptr->release();
            }
            m_ptr = other.m_ptr;
        }
        return *this;
    }

    RefPtr& operator=(RefPtr&& other) noexcept {
        if (this != &other) {
            if (m_ptr) {
                m_ptr->release();
            }
            m_ptr = other.m_ptr;
            other.m_ptr = nullptr;
        }
        return *this;
    }

    RefPtr& operator=(std::nullptr_t) noexcept {
        reset();
        return *this;
    }

    [[nodiscard]] T* get() const noexcept { return m_ptr; }
    [[nodiscard]] T* operator->() const noexcept { return m_ptr; }
    [[nodiscard]] T& operator*() const noexcept { return *m_ptr; }

    [[nodiscard]] explicit operator bool() const noexcept { return m_ptr != nullptr; }

    void reset() noexcept {
        if (m_ptr) {
            m_ptr->release();
            m_ptr = nullptr;
        }
    }

    [[nodiscard]] bool operator==(const RefPtr& other) const noexcept {
        return m_ptr == other.m_ptr;
    }

    [[nodiscard]] bool operator==(std::nullptr_t) const noexcept {
        return m_ptr == nullptr;
    }

private:
    T* m_ptr;
};

template<typename T, typename... Args>
RefPtr<T> make_ref(Args&&... args) {
    return RefPtr<T>(new T(std::forward<Args>(args)...));
}

// ============================================================================
// RefCounted - Base class for reference counted objects
// ============================================================================

class RefCounted {
public:
    RefCounted() : m_ref_count(0) {}
    virtual ~RefCounted() = default;

    RefCounted(const RefCounted&) : m_ref_count(0) {}
    RefCounted& operator=(const RefCounted&) { return *this; }

    void add_ref() const noexcept {
        m_ref_count.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const noexcept {
        if (m_ref_count.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            delete this;
        }
    }

    [[nodiscard]] u32 ref_count() const noexcept {
        return m_ref_count.load(std::memory_order_relaxed);
    }

private:
    mutable std::atomic<u32> m_ref_count;
};

} // namespace quarry
