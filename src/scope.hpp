#pragma once
#include <cstddef>
#include <limits>
#include <new>
#include <type_traits>
#include <utility>
#include "slice.hpp"

class MemoryArena;

// Exclusive, temporary access to a MemoryArena. Everything allocated
// through a Scope is reclaimed at once when it is released, explicitly or
// by the destructor. References it handed out must not be used after that.
// The arena tracks the Scope's address, so moves re-register it.
class Scope
{
public:
    ~Scope() { release(); }

    Scope(const Scope &) = delete;
    Scope &operator=(const Scope &) = delete;

    Scope(Scope &&other) noexcept;
    Scope &operator=(Scope &&other) noexcept;

    template <class T>
    T &alloc(const T &value)
    {
        static_assert(is_plain_data_v<T>,
                      "Scope::alloc: T must be trivially copyable and trivially destructible");
        void *p = reserve_bytes(sizeof(T), alignof(T));
        return *::new (p) T(value);
    }

    template <class T, class... Args>
    T &emplace(Args &&...args)
    {
        static_assert(is_plain_data_v<T>,
                      "Scope::emplace: T must be trivially copyable and trivially destructible");
        void *p = reserve_bytes(sizeof(T), alignof(T));
        if constexpr (std::is_constructible_v<T, Args...>)
            return *::new (p) T(std::forward<Args>(args)...);
        else // aggregates
            return *::new (p) T{std::forward<Args>(args)...};
    }

    // Elements are left uninitialized.
    template <class T>
    Slice<T> alloc_slice(std::size_t len)
    {
        static_assert(is_plain_data_v<T>,
                      "Scope::alloc_slice: T must be trivially copyable and trivially destructible");
        if (len == 0)
        {
            check_active();
            return Slice<T>();
        }
        if (len > std::numeric_limits<std::size_t>::max() / sizeof(T))
            throw std::bad_array_new_length();
        void *p = reserve_bytes(len * sizeof(T), alignof(T));
        return Slice<T>(static_cast<T *>(p), len);
    }

    // Throws std::invalid_argument unless align is a power of two.
    void *alloc_bytes(std::size_t size, std::size_t align);

    // Resets every block cursor and hands the arena back. No-op once done.
    void release() noexcept;

    bool active() const noexcept { return arena_ != nullptr; }

private:
    friend class MemoryArena;
    explicit Scope(MemoryArena &arena) noexcept;

    void check_active() const;
    void *reserve_bytes(std::size_t size, std::size_t align);

    MemoryArena *arena_;
};
