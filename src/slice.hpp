#pragma once
#include <cstddef>
#include <stdexcept>
#include <type_traits>

// Types that may live in an arena: nothing to run when a scope resets.
template <class T>
inline constexpr bool is_plain_data_v =
    std::is_trivially_copyable_v<T> && std::is_trivially_destructible_v<T>;

// Non-owning view of `size` elements in arena memory.
// Valid until the Scope that produced it is released.
template <class T>
class Slice
{
public:
    using value_type = T;

    Slice() noexcept : data_(nullptr), size_(0) {}
    Slice(T *data, std::size_t size) noexcept : data_(data), size_(size) {}

    std::size_t size() const noexcept { return size_; }
    std::size_t size_bytes() const noexcept { return size_ * sizeof(T); }
    bool empty() const noexcept { return size_ == 0; }

    // Checked like at(); raw access goes through data().
    T &operator[](std::size_t i) const { return at(i); }
    T &at(std::size_t i) const
    {
        if (i >= size_)
            throw std::out_of_range("Slice::at");
        return data_[i];
    }

    // shallow const, like a pointer
    T *data() const noexcept { return data_; }
    T *begin() const noexcept { return data_; }
    T *end() const noexcept { return data_ + size_; }

    void fill(const T &v) const noexcept
    {
        for (T *p = data_; p != data_ + size_; ++p)
            *p = v;
    }

private:
    T *data_;
    std::size_t size_;
};
