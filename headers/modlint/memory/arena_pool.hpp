#ifndef MODLINT_ARENA_POOL_HPP
#define MODLINT_ARENA_POOL_HPP

/**
 * @file arena_pool.hpp
 * @brief Pool of reusable arenas, one per in-flight task.
 *
 * Every processing or analysis task borrows an Arena through an ArenaLease.
 * The lease is move-only; when it is destroyed the arena is reset and goes
 * back to the idle list, so memory reserved by one task is reused by the next
 * instead of being returned to the system.
 *
 * The pool never blocks: when no arena is idle a new one is created. A lease
 * may be kept alive by a module's retained content across the whole
 * analysis phase of a batch, so blocking on a fixed count would stall the
 * workers that are supposed to finish that batch.
 *
 * @code
 *     auto pool = ArenaPool::create(4).value();
 *     {
 *         ArenaLease lease = pool->acquire();
 *         auto text = lease->copy_string("hello");
 *     }   // arena reset and returned here
 * @endcode
 */

#include "modlint/memory/arena.hpp"
#include "modlint/result.hpp"
#include "modlint/error.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace modlint::memory {

    class ArenaPool;

    /**
     * Exclusive access to one arena of a pool.
     */
    class ArenaLease {
    public:
        ArenaLease(ArenaLease&& other) noexcept;
        ArenaLease& operator=(ArenaLease&& other) noexcept;
        ~ArenaLease();

        ArenaLease(const ArenaLease&) = delete;
        ArenaLease& operator=(const ArenaLease&) = delete;

        [[nodiscard]] Arena& get() const noexcept { return *arena_; }
        Arena& operator*() const noexcept { return *arena_; }
        Arena* operator->() const noexcept { return arena_.get(); }

    private:
        friend class ArenaPool;

        ArenaLease(ArenaPool* pool, std::unique_ptr<Arena> arena) noexcept
            : pool_(pool), arena_(std::move(arena)) {}

        void release() noexcept;

        ArenaPool* pool_ = nullptr;
        std::unique_ptr<Arena> arena_;
    };

    /**
     * Pool statistics, readable at any time.
     */
    struct ArenaPoolStats {
        std::size_t created = 0;
        std::size_t leased = 0;
        std::size_t peak_leased = 0;
        std::size_t idle = 0;
    };

    class ArenaPool {
    public:
        /**
         * Creates a pool sized for capacity concurrent tasks.
         *
         * Fails with ConfigError when capacity or block_size is zero.
         */
        [[nodiscard]] static Result<std::unique_ptr<ArenaPool>, Error> create(
            std::size_t capacity,
            std::size_t block_size = DEFAULT_BLOCK_SIZE
        );

        ArenaPool(const ArenaPool&) = delete;
        ArenaPool& operator=(const ArenaPool&) = delete;

        /**
         * Borrows an idle arena, creating one when none is idle.
         */
        [[nodiscard]] ArenaLease acquire();

        [[nodiscard]] ArenaPoolStats stats() const;

        [[nodiscard]] std::size_t capacity() const noexcept {
            return capacity_;
        }

    private:
        friend class ArenaLease;

        ArenaPool(std::size_t capacity, std::size_t block_size);

        void give_back(std::unique_ptr<Arena> arena) noexcept;

        std::size_t capacity_;
        std::size_t block_size_;

        mutable std::mutex mutex_;
        std::vector<std::unique_ptr<Arena>> idle_;
        std::size_t created_ = 0;
        std::size_t leased_ = 0;
        std::size_t peak_leased_ = 0;
    };

}  // namespace modlint::memory

#endif // MODLINT_ARENA_POOL_HPP
