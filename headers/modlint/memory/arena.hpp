#ifndef MODLINT_ARENA_HPP
#define MODLINT_ARENA_HPP

/**
 * @file arena.hpp
 * @brief Bump allocator used for all per-file parse and analysis data.
 *
 * An Arena hands out memory by advancing a cursor inside large blocks. Nothing
 * is freed individually; reset() rewinds every block so the memory is reused
 * by the next task. Arena derives from std::pmr::memory_resource, so
 * std::pmr containers (strings, vectors) can be placed in it directly.
 *
 * An Arena is not thread-safe. It is owned by exactly one task at a time,
 * which is what ArenaPool guarantees.
 */

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <new>
#include <string_view>
#include <utility>
#include <vector>

namespace modlint::memory {

    /**
     * Default size of one arena block (1 MiB).
     */
    inline constexpr std::size_t DEFAULT_BLOCK_SIZE = std::size_t{1} << 20;

    class Arena final : public std::pmr::memory_resource {
    public:
        explicit Arena(std::size_t block_size = DEFAULT_BLOCK_SIZE);
        ~Arena() override = default;

        Arena(const Arena&) = delete;
        Arena& operator=(const Arena&) = delete;

        /**
         * Allocates and constructs a T inside the arena.
         *
         * The destructor of T is never run; only place types whose members
         * also allocate from this arena (or are trivially destructible).
         */
        template<typename T, typename... Args>
        T* make(Args&&... args) {
            void* p = allocate(sizeof(T), alignof(T));
            return ::new (p) T(std::forward<Args>(args)...);
        }

        /**
         * Copies text into the arena and returns a view of the copy.
         */
        std::string_view copy_string(std::string_view text);

        /**
         * Rewinds every block. Blocks stay allocated; oversized blocks beyond
         * the first are kept too, so steady-state runs stop calling malloc.
         */
        void reset() noexcept;

        /**
         * Bytes handed out since the last reset.
         */
        [[nodiscard]] std::size_t used_bytes() const noexcept;

        /**
         * Bytes reserved from the system across all blocks.
         */
        [[nodiscard]] std::size_t reserved_bytes() const noexcept;

        [[nodiscard]] std::size_t block_count() const noexcept {
            return blocks_.size();
        }

        [[nodiscard]] std::size_t block_size() const noexcept {
            return block_size_;
        }

    protected:
        void* do_allocate(std::size_t bytes, std::size_t alignment) override;

        // Individual frees are no-ops; memory comes back on reset().
        void do_deallocate(void*, std::size_t, std::size_t) override {}

        bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
            return this == &other;
        }

    private:
        struct Block {
            std::unique_ptr<std::byte[]> memory;
            std::size_t size = 0;
            std::size_t used = 0;
        };

        Block& add_block(std::size_t min_size);

        std::vector<Block> blocks_;
        std::size_t current_ = 0;
        std::size_t block_size_;
    };

}  // namespace modlint::memory

#endif // MODLINT_ARENA_HPP
