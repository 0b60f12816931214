#include "modlint/memory/arena.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>

namespace modlint::memory {

    namespace {
        std::size_t align_up(const std::size_t value, const std::size_t alignment) noexcept {
            return (value + alignment - 1) & ~(alignment - 1);
        }
    }

    Arena::Arena(const std::size_t block_size)
        : block_size_(block_size) {}

    Arena::Block& Arena::add_block(const std::size_t min_size) {
        const std::size_t size = std::max(block_size_, min_size);
        Block block;
        block.memory = std::make_unique<std::byte[]>(size);
        block.size = size;
        blocks_.push_back(std::move(block));
        current_ = blocks_.size() - 1;
        return blocks_.back();
    }

    void* Arena::do_allocate(const std::size_t bytes, const std::size_t alignment) {
        const std::size_t request = std::max<std::size_t>(bytes, 1);

        // Try the current block, then any later block left over from a previous
        // task (reset() rewinds them all to empty).
        for (std::size_t i = current_; i < blocks_.size(); ++i) {
            Block& block = blocks_[i];
            const auto base = reinterpret_cast<std::uintptr_t>(block.memory.get());
            const std::size_t offset = align_up(base + block.used, alignment) - base;
            if (offset + request <= block.size) {
                block.used = offset + request;
                current_ = i;
                return block.memory.get() + offset;
            }
        }

        Block& block = add_block(request + alignment);
        const auto base = reinterpret_cast<std::uintptr_t>(block.memory.get());
        const std::size_t offset = align_up(base, alignment) - base;
        block.used = offset + request;
        return block.memory.get() + offset;
    }

    std::string_view Arena::copy_string(const std::string_view text) {
        if (text.empty()) {
            return {};
        }
        auto* p = static_cast<char*>(allocate(text.size(), alignof(char)));
        std::memcpy(p, text.data(), text.size());
        return {p, text.size()};
    }

    void Arena::reset() noexcept {
        for (auto& block : blocks_) {
            block.used = 0;
        }
        current_ = 0;
    }

    std::size_t Arena::used_bytes() const noexcept {
        std::size_t total = 0;
        for (const auto& block : blocks_) {
            total += block.used;
        }
        return total;
    }

    std::size_t Arena::reserved_bytes() const noexcept {
        std::size_t total = 0;
        for (const auto& block : blocks_) {
            total += block.size;
        }
        return total;
    }

}  // namespace modlint::memory
