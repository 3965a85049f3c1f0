#pragma once
#include <cstddef>
#include <iosfwd>
#include <vector>
#include "block.hpp"
#include "scope.hpp"

// Pool of Blocks reused across scopes. Allocation goes through a Scope;
// at most one Scope is open at a time. Blocks are only ever appended, so
// the memory high-water mark stays until the arena is destroyed.
//
// Not copyable or movable: an open Scope points at the arena. Destroying
// the arena under a live Scope detaches that Scope, which then throws on
// allocation and releases nothing.
class MemoryArena
{
public:
    static constexpr std::size_t kBytesPerMiB = 1024 * 1024;

    explicit MemoryArena(std::size_t block_size_mb);
    static MemoryArena from_bytes(std::size_t block_size_bytes);
    ~MemoryArena();

    MemoryArena(const MemoryArena &) = delete;
    MemoryArena &operator=(const MemoryArena &) = delete;
    MemoryArena(MemoryArena &&) = delete;
    MemoryArena &operator=(MemoryArena &&) = delete;

    // Throws std::logic_error if a Scope is already open.
    Scope open_scope();

    bool scope_open() const noexcept { return scope_ != nullptr; }
    std::size_t block_size() const noexcept { return block_size_; }
    std::size_t block_count() const noexcept { return blocks_.size(); }
    const Block &block(std::size_t i) const;
    std::size_t total_capacity() const noexcept;
    std::size_t bytes_used() const noexcept;

    void describe(std::ostream &os) const;

private:
    friend class Scope;

    struct BytesTag
    {
    };
    MemoryArena(BytesTag, std::size_t block_size_bytes);

    // First fit over the blocks, growing by one block if none fits.
    void *reserve(std::size_t size, std::size_t align);
    void close_scope() noexcept;

    std::vector<Block> blocks_;
    std::size_t block_size_;
    // the open Scope, if any
    Scope *scope_ = nullptr;
};
