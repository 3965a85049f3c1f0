#pragma once
#include <cstddef>

// One fixed-capacity byte buffer with a bump cursor.
// The storage never moves; moving a Block only hands over the pointer.
class Block
{
public:
    explicit Block(std::size_t capacity);
    ~Block();

    Block(const Block &) = delete;
    Block &operator=(const Block &) = delete;

    Block(Block &&other) noexcept;
    Block &operator=(Block &&other) noexcept;

    bool has_room(std::size_t size, std::size_t align) const noexcept;

    // Claims `size` bytes at `align` and returns the aligned start,
    // or nullptr with the cursor untouched if the block is too full.
    void *reserve(std::size_t size, std::size_t align) noexcept;

    // Rewinds the cursor. Contents are left as they are.
    void reset() noexcept { used_ = 0; }

    std::size_t capacity() const noexcept { return cap_; }
    std::size_t used() const noexcept { return used_; }
    std::size_t remaining() const noexcept { return cap_ - used_; }
    const std::byte *data() const noexcept { return data_; }

private:
    std::byte *data_;
    std::size_t cap_;
    std::size_t used_;

    // padding needed at the cursor, 0 if already aligned
    std::size_t pad_at_cursor(std::size_t align) const noexcept;
    void free_storage() noexcept;
};
