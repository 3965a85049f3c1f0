#include "block.hpp"
#include "align.hpp"
#include <new>

Block::Block(std::size_t capacity)
    : data_(static_cast<std::byte *>(::operator new(capacity))), cap_(capacity), used_(0)
{
}

Block::~Block()
{
    free_storage();
}

Block::Block(Block &&other) noexcept
    : data_(other.data_), cap_(other.cap_), used_(other.used_)
{
    other.data_ = nullptr;
    other.cap_ = 0;
    other.used_ = 0;
}

Block &Block::operator=(Block &&other) noexcept
{
    if (this != &other)
    {
        free_storage();
        data_ = other.data_;
        cap_ = other.cap_;
        used_ = other.used_;
        other.data_ = nullptr;
        other.cap_ = 0;
        other.used_ = 0;
    }
    return *this;
}

std::size_t Block::pad_at_cursor(std::size_t align) const noexcept
{
    return padding_for(data_ + used_, align);
}

bool Block::has_room(std::size_t size, std::size_t align) const noexcept
{
    const std::size_t pad = pad_at_cursor(align);
    const std::size_t left = cap_ - used_;
    // split so size + pad cannot wrap
    return pad <= left && size <= left - pad;
}

void *Block::reserve(std::size_t size, std::size_t align) noexcept
{
    if (!has_room(size, align))
        return nullptr;
    const std::size_t pad = pad_at_cursor(align);
    std::byte *out = data_ + used_ + pad;
    used_ += pad + size;
    return out;
}

void Block::free_storage() noexcept
{
    ::operator delete(data_);
    data_ = nullptr;
}
