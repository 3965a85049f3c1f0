#include "scope.hpp"
#include "align.hpp"
#include "arena.hpp"
#include <stdexcept>

Scope::Scope(MemoryArena &arena) noexcept : arena_(&arena)
{
    arena.scope_ = this;
}

Scope::Scope(Scope &&other) noexcept : arena_(other.arena_)
{
    other.arena_ = nullptr;
    if (arena_)
        arena_->scope_ = this;
}

Scope &Scope::operator=(Scope &&other) noexcept
{
    if (this != &other)
    {
        release();
        arena_ = other.arena_;
        other.arena_ = nullptr;
        if (arena_)
            arena_->scope_ = this;
    }
    return *this;
}

void *Scope::alloc_bytes(std::size_t size, std::size_t align)
{
    if (!is_pow2(align))
        throw std::invalid_argument("Scope::alloc_bytes: alignment must be a power of two");
    return reserve_bytes(size, align);
}

void Scope::release() noexcept
{
    if (!arena_)
        return;
    arena_->close_scope();
    arena_ = nullptr;
}

void Scope::check_active() const
{
    if (!arena_)
        throw std::logic_error("Scope: allocation through a released or detached scope");
}

void *Scope::reserve_bytes(std::size_t size, std::size_t align)
{
    check_active();
    return arena_->reserve(size, align);
}
