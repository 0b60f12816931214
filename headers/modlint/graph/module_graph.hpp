#ifndef MODLINT_MODULE_GRAPH_HPP
#define MODLINT_MODULE_GRAPH_HPP

/**
 * @file module_graph.hpp
 * @brief Module dependency graph built during a run.
 *
 * Nodes are keyed by resolved path and hold the module records of every
 * segment. Edges are resolved import relationships; a failed resolution is
 * kept on the node as an unresolved request instead of an edge.
 *
 * The graph has exactly one writer, the graph coordinator. Analysis tasks
 * read it through a const reference while no batch is being drained, so it
 * carries no lock. Cycles are allowed; the dispatched set guarantees that
 * each path is processed at most once per run regardless of them.
 */

#include "modlint/graph/module_record.hpp"
#include "modlint/error.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace modlint::graph {

    struct ModuleEdge {
        std::string specifier;
        fs::path target;
    };

    struct UnresolvedRequest {
        std::string specifier;
        Error error;
    };

    struct ModuleNode {
        fs::path path;
        std::vector<std::shared_ptr<ModuleRecord>> records;
        std::vector<ModuleEdge> edges;
        std::vector<UnresolvedRequest> unresolved;
        bool failed = false;
        bool entry = false;
        bool edges_released = false;

        /**
         * Record that importers of this module link against.
         */
        [[nodiscard]] const ModuleRecord* link_target() const noexcept {
            return records.empty() ? nullptr : records.back().get();
        }
    };

    struct GraphStats {
        std::size_t node_count = 0;
        std::size_t edge_count = 0;
        std::size_t failed_count = 0;
        std::size_t entry_count = 0;
        std::size_t unresolved_count = 0;
    };

    class ModuleGraph {
    public:
        ModuleGraph() = default;

        // ------------------------------------------------------------------ dispatch

        /**
         * Marks path as dispatched for processing.
         *
         * @return true if it was not dispatched before in this run.
         */
        bool mark_dispatched(const fs::path& path);

        [[nodiscard]] bool is_dispatched(const fs::path& path) const;

        [[nodiscard]] std::size_t dispatched_count() const noexcept {
            return dispatched_.size();
        }

        // ------------------------------------------------------------------ mutation

        /**
         * Adds a node for path if it has none, and returns it.
         */
        ModuleNode& add_module(const fs::path& path);

        void add_record(const fs::path& path, std::shared_ptr<ModuleRecord> record);

        /**
         * Adds a resolved edge. Repeated (from, to) pairs under different
         * specifiers count as one edge.
         */
        void add_edge(const fs::path& from, const std::string& specifier, const fs::path& to);

        void add_unresolved(const fs::path& from, std::string specifier, Error error);

        void mark_failed(const fs::path& path);

        void mark_entry(const fs::path& path);

        /**
         * Fills loaded_modules of every record of path from its edges.
         */
        void link(const fs::path& path);

        /**
         * Drops the outgoing edges of path, keeping the node and its records.
         */
        void release_edges(const fs::path& path);

        // ------------------------------------------------------------------- queries

        [[nodiscard]] bool has_module(const fs::path& path) const;

        [[nodiscard]] const ModuleNode* find(const fs::path& path) const;

        [[nodiscard]] bool has_edge(const fs::path& from, const fs::path& to) const;

        [[nodiscard]] std::size_t node_count() const noexcept {
            return nodes_.size();
        }

        [[nodiscard]] std::size_t edge_count() const noexcept {
            return edge_count_;
        }

        /**
         * All node paths in lexical order.
         */
        [[nodiscard]] std::vector<fs::path> modules() const;

        [[nodiscard]] std::vector<fs::path> successors(const fs::path& path) const;

        [[nodiscard]] std::vector<fs::path> predecessors(const fs::path& path) const;

        /**
         * Shortest dependency path from -> ... -> to, if to is reachable.
         */
        [[nodiscard]] std::optional<std::vector<fs::path>> find_path(
            const fs::path& from,
            const fs::path& to
        ) const;

        [[nodiscard]] GraphStats stats() const;

    private:
        std::map<fs::path, ModuleNode> nodes_;
        std::map<fs::path, std::set<fs::path>> successors_;
        std::map<fs::path, std::set<fs::path>> predecessors_;
        std::set<fs::path> dispatched_;
        std::size_t edge_count_ = 0;
    };

}  // namespace modlint::graph

#endif // MODLINT_MODULE_GRAPH_HPP
