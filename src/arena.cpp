#include "arena.hpp"
#include <algorithm>
#include <limits>
#include <new>
#include <ostream>
#include <stdexcept>

namespace
{
std::size_t mib_to_bytes(std::size_t mb)
{
    if (mb > std::numeric_limits<std::size_t>::max() / MemoryArena::kBytesPerMiB)
        throw std::length_error("MemoryArena: block size overflows size_t");
    return mb * MemoryArena::kBytesPerMiB;
}
} // namespace

MemoryArena::MemoryArena(std::size_t block_size_mb)
    : MemoryArena(BytesTag{}, mib_to_bytes(block_size_mb))
{
}

MemoryArena::MemoryArena(BytesTag, std::size_t block_size_bytes)
    : block_size_(block_size_bytes)
{
    blocks_.emplace_back(block_size_);
}

MemoryArena::~MemoryArena()
{
    if (scope_)
        scope_->arena_ = nullptr;
}

MemoryArena MemoryArena::from_bytes(std::size_t block_size_bytes)
{
    return MemoryArena(BytesTag{}, block_size_bytes);
}

Scope MemoryArena::open_scope()
{
    if (scope_)
        throw std::logic_error("MemoryArena::open_scope: a scope is already open");
    // the Scope constructor registers itself in scope_
    return Scope(*this);
}

const Block &MemoryArena::block(std::size_t i) const
{
    if (i >= blocks_.size())
        throw std::out_of_range("MemoryArena::block");
    return blocks_[i];
}

std::size_t MemoryArena::total_capacity() const noexcept
{
    std::size_t n = 0;
    for (const auto &b : blocks_)
        n += b.capacity();
    return n;
}

std::size_t MemoryArena::bytes_used() const noexcept
{
    std::size_t n = 0;
    for (const auto &b : blocks_)
        n += b.used();
    return n;
}

void MemoryArena::describe(std::ostream &os) const
{
    for (std::size_t i = 0; i < blocks_.size(); ++i)
        os << "block " << i << ": used " << blocks_[i].used() << " / "
           << blocks_[i].capacity() << " bytes\n";
    os << "arena: " << blocks_.size() << " blocks, " << bytes_used() << " / "
       << total_capacity() << " bytes, scope " << (scope_ ? "open" : "closed") << "\n";
}

void *MemoryArena::reserve(std::size_t size, std::size_t align)
{
    for (auto &b : blocks_)
    {
        if (void *p = b.reserve(size, align))
            return p;
    }
    // align bytes of slack cover any padding at the new block's start
    if (size > std::numeric_limits<std::size_t>::max() - align)
        throw std::bad_array_new_length();
    blocks_.emplace_back(std::max(block_size_, size + align));
    return blocks_.back().reserve(size, align);
}

void MemoryArena::close_scope() noexcept
{
    for (auto &b : blocks_)
        b.reset();
    scope_ = nullptr;
}
