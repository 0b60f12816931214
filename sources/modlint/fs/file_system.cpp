#include "modlint/fs/file_system.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace modlint::fsys {

    // ============================================================================
    // OsFileSystem
    // ============================================================================

    Result<std::string_view, Error> OsFileSystem::read_to_arena(
        const fs::path& path,
        memory::Arena& arena
    ) const {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec) {
            return Result<std::string_view, Error>::failure(
                Error::io_error("Failed to open file: " + ec.message(), path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string_view, Error>::failure(
                Error::io_error(std::string("Failed to open file: ") + std::strerror(errno), path.string())
            );
        }

        if (size == 0) {
            return Result<std::string_view, Error>::success(std::string_view{});
        }

        auto* buffer = static_cast<char*>(arena.allocate(size, alignof(char)));
        file.read(buffer, static_cast<std::streamsize>(size));
        if (file.gcount() != static_cast<std::streamsize>(size)) {
            return Result<std::string_view, Error>::failure(
                Error::io_error("Short read", path.string())
            );
        }

        return Result<std::string_view, Error>::success(std::string_view(buffer, size));
    }

    Result<void, Error> OsFileSystem::write(const fs::path& path, const std::string_view content) const {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    bool OsFileSystem::is_file(const fs::path& path) const {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    // ============================================================================
    // MemoryFileSystem
    // ============================================================================

    void MemoryFileSystem::add_file(const fs::path& path, std::string content) {
        std::lock_guard lock(mutex_);
        files_[path] = Entry{std::move(content), true, 0, 0};
    }

    void MemoryFileSystem::add_unreadable(const fs::path& path) {
        std::lock_guard lock(mutex_);
        files_[path] = Entry{{}, false, 0, 0};
    }

    std::optional<std::string> MemoryFileSystem::content(const fs::path& path) const {
        std::lock_guard lock(mutex_);
        if (const auto it = files_.find(path); it != files_.end()) {
            return it->second.content;
        }
        return std::nullopt;
    }

    std::size_t MemoryFileSystem::write_count(const fs::path& path) const {
        std::lock_guard lock(mutex_);
        const auto it = files_.find(path);
        return it == files_.end() ? 0 : it->second.writes;
    }

    std::size_t MemoryFileSystem::total_writes() const {
        std::lock_guard lock(mutex_);
        std::size_t total = 0;
        for (const auto& [path, entry] : files_) {
            total += entry.writes;
        }
        return total;
    }

    std::size_t MemoryFileSystem::read_count(const fs::path& path) const {
        std::lock_guard lock(mutex_);
        const auto it = files_.find(path);
        return it == files_.end() ? 0 : it->second.reads;
    }

    Result<std::string_view, Error> MemoryFileSystem::read_to_arena(
        const fs::path& path,
        memory::Arena& arena
    ) const {
        std::lock_guard lock(mutex_);
        const auto it = files_.find(path);
        if (it == files_.end()) {
            return Result<std::string_view, Error>::failure(
                Error::io_error("Failed to open file: No such file or directory", path.string())
            );
        }
        ++it->second.reads;
        if (!it->second.readable) {
            return Result<std::string_view, Error>::failure(
                Error::io_error("Failed to open file: Permission denied", path.string())
            );
        }
        return Result<std::string_view, Error>::success(arena.copy_string(it->second.content));
    }

    Result<void, Error> MemoryFileSystem::write(const fs::path& path, const std::string_view content) const {
        std::lock_guard lock(mutex_);
        auto& entry = files_[path];
        entry.content.assign(content);
        entry.readable = true;
        ++entry.writes;
        return Result<void, Error>::success();
    }

    bool MemoryFileSystem::is_file(const fs::path& path) const {
        std::lock_guard lock(mutex_);
        return files_.contains(path);
    }

}  // namespace modlint::fsys
