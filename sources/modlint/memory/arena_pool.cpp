#include "modlint/memory/arena_pool.hpp"

#include <algorithm>

namespace modlint::memory {

    // ============================================================================
    // ArenaLease
    // ============================================================================

    ArenaLease::ArenaLease(ArenaLease&& other) noexcept
        : pool_(other.pool_)
        , arena_(std::move(other.arena_)) {
        other.pool_ = nullptr;
    }

    ArenaLease& ArenaLease::operator=(ArenaLease&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = other.pool_;
            arena_ = std::move(other.arena_);
            other.pool_ = nullptr;
        }
        return *this;
    }

    ArenaLease::~ArenaLease() {
        release();
    }

    void ArenaLease::release() noexcept {
        if (pool_ != nullptr && arena_) {
            pool_->give_back(std::move(arena_));
        }
        pool_ = nullptr;
    }

    // ============================================================================
    // ArenaPool
    // ============================================================================

    Result<std::unique_ptr<ArenaPool>, Error> ArenaPool::create(
        const std::size_t capacity,
        const std::size_t block_size
    ) {
        if (capacity == 0) {
            return Result<std::unique_ptr<ArenaPool>, Error>::failure(
                Error::config_error("Arena pool capacity must be at least 1")
            );
        }
        if (block_size == 0) {
            return Result<std::unique_ptr<ArenaPool>, Error>::failure(
                Error::config_error("Arena block size must be non-zero")
            );
        }
        return Result<std::unique_ptr<ArenaPool>, Error>::success(
            std::unique_ptr<ArenaPool>(new ArenaPool(capacity, block_size))
        );
    }

    ArenaPool::ArenaPool(const std::size_t capacity, const std::size_t block_size)
        : capacity_(capacity)
        , block_size_(block_size) {
        idle_.reserve(capacity);
    }

    ArenaLease ArenaPool::acquire() {
        std::unique_ptr<Arena> arena;
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty()) {
                arena = std::move(idle_.back());
                idle_.pop_back();
            } else {
                ++created_;
            }
            ++leased_;
            peak_leased_ = std::max(peak_leased_, leased_);
        }

        // Arenas are created lazily, outside the lock; a pool that is never
        // used in parallel only ever holds one.
        if (!arena) {
            arena = std::make_unique<Arena>(block_size_);
        }
        return ArenaLease(this, std::move(arena));
    }

    void ArenaPool::give_back(std::unique_ptr<Arena> arena) noexcept {
        arena->reset();
        std::lock_guard lock(mutex_);
        --leased_;
        idle_.push_back(std::move(arena));
    }

    ArenaPoolStats ArenaPool::stats() const {
        std::lock_guard lock(mutex_);
        return {created_, leased_, peak_leased_, idle_.size()};
    }

}  // namespace modlint::memory
