#ifndef MODLINT_FILE_SYSTEM_HPP
#define MODLINT_FILE_SYSTEM_HPP

/**
 * @file file_system.hpp
 * @brief File-system collaborator used by the runtime.
 *
 * The runtime never opens files directly. Reads go into the caller's arena,
 * writes (applied fixes) go through write(). Implementations:
 * - OsFileSystem: the real disk
 * - MemoryFileSystem: an in-memory map, for tests and for editors that hold
 *   unsaved buffers
 *
 * Implementations must be safe to call from several worker threads at once.
 */

#include "modlint/memory/arena.hpp"
#include "modlint/result.hpp"
#include "modlint/error.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace modlint::fsys {

    namespace fs = std::filesystem;

    class IFileSystem {
    public:
        virtual ~IFileSystem() = default;

        /**
         * Reads the whole file into arena memory.
         */
        [[nodiscard]] virtual Result<std::string_view, Error> read_to_arena(
            const fs::path& path,
            memory::Arena& arena
        ) const = 0;

        /**
         * Replaces the file's content.
         */
        [[nodiscard]] virtual Result<void, Error> write(
            const fs::path& path,
            std::string_view content
        ) const = 0;

        /**
         * True if path names an existing regular file.
         */
        [[nodiscard]] virtual bool is_file(const fs::path& path) const = 0;
    };

    class OsFileSystem final : public IFileSystem {
    public:
        [[nodiscard]] Result<std::string_view, Error> read_to_arena(
            const fs::path& path,
            memory::Arena& arena
        ) const override;

        [[nodiscard]] Result<void, Error> write(
            const fs::path& path,
            std::string_view content
        ) const override;

        [[nodiscard]] bool is_file(const fs::path& path) const override;
    };

    /**
     * In-memory file system keyed by exact path.
     *
     * Counts writes per path so callers can check that a file was written
     * exactly once.
     */
    class MemoryFileSystem final : public IFileSystem {
    public:
        void add_file(const fs::path& path, std::string content);

        /**
         * Makes reads of path fail with an IoError (file present but unreadable).
         */
        void add_unreadable(const fs::path& path);

        [[nodiscard]] std::optional<std::string> content(const fs::path& path) const;
        [[nodiscard]] std::size_t write_count(const fs::path& path) const;
        [[nodiscard]] std::size_t total_writes() const;
        [[nodiscard]] std::size_t read_count(const fs::path& path) const;

        [[nodiscard]] Result<std::string_view, Error> read_to_arena(
            const fs::path& path,
            memory::Arena& arena
        ) const override;

        [[nodiscard]] Result<void, Error> write(
            const fs::path& path,
            std::string_view content
        ) const override;

        [[nodiscard]] bool is_file(const fs::path& path) const override;

    private:
        struct Entry {
            std::string content;
            bool readable = true;
            std::size_t writes = 0;
            std::size_t reads = 0;
        };

        mutable std::mutex mutex_;
        mutable std::map<fs::path, Entry> files_;
    };

}  // namespace modlint::fsys

#endif // MODLINT_FILE_SYSTEM_HPP
