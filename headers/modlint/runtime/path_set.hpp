#ifndef MODLINT_PATH_SET_HPP
#define MODLINT_PATH_SET_HPP

/**
 * @file path_set.hpp
 * @brief Deduplicated, insertion-ordered set of file paths.
 */

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <set>
#include <vector>

namespace modlint::runtime {

    namespace fs = std::filesystem;

    class PathSet {
    public:
        PathSet() = default;

        PathSet(const std::initializer_list<fs::path> paths) {
            for (const auto& p : paths) {
                insert(p);
            }
        }

        explicit PathSet(const std::vector<fs::path>& paths) {
            for (const auto& p : paths) {
                insert(p);
            }
        }

        /**
         * @return true if path was not present.
         */
        bool insert(const fs::path& path) {
            if (!index_.insert(path).second) {
                return false;
            }
            order_.push_back(path);
            return true;
        }

        [[nodiscard]] bool contains(const fs::path& path) const {
            return index_.contains(path);
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return order_.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return order_.empty();
        }

        [[nodiscard]] const std::vector<fs::path>& paths() const noexcept {
            return order_;
        }

        [[nodiscard]] auto begin() const noexcept { return order_.begin(); }
        [[nodiscard]] auto end() const noexcept { return order_.end(); }

    private:
        std::vector<fs::path> order_;
        std::set<fs::path> index_;
    };

}  // namespace modlint::runtime

#endif // MODLINT_PATH_SET_HPP
