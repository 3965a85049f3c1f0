#pragma once
#include <cstddef>
#include <cstdint>

// Bytes to skip so that `address` lands on a multiple of `align`.
// `align` must be a non-zero power of two; not checked here.
constexpr std::size_t padding_for(std::uintptr_t address, std::size_t align) noexcept
{
    const std::size_t rem = static_cast<std::size_t>(address & (align - 1));
    return rem == 0 ? 0 : align - rem;
}

inline std::size_t padding_for(const void *p, std::size_t align) noexcept
{
    return padding_for(reinterpret_cast<std::uintptr_t>(p), align);
}

constexpr bool is_pow2(std::size_t x) noexcept
{
    return x != 0 && (x & (x - 1)) == 0;
}
