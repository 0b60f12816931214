#include "modlint/graph/module_graph.hpp"

#include <algorithm>
#include <deque>

namespace modlint::graph {

    // ============================================================================
    // ModuleGraph Implementation
    // ============================================================================

    bool ModuleGraph::mark_dispatched(const fs::path& path) {
        return dispatched_.insert(path).second;
    }

    bool ModuleGraph::is_dispatched(const fs::path& path) const {
        return dispatched_.contains(path);
    }

    ModuleNode& ModuleGraph::add_module(const fs::path& path) {
        auto [it, inserted] = nodes_.try_emplace(path);
        if (inserted) {
            it->second.path = path;
            successors_[path];
            predecessors_[path];
        }
        return it->second;
    }

    void ModuleGraph::add_record(const fs::path& path, std::shared_ptr<ModuleRecord> record) {
        add_module(path).records.push_back(std::move(record));
    }

    void ModuleGraph::add_edge(const fs::path& from, const std::string& specifier, const fs::path& to) {
        add_module(to);
        auto& node = add_module(from);
        node.edges.push_back(ModuleEdge{specifier, to});

        if (successors_[from].insert(to).second) {
            predecessors_[to].insert(from);
            ++edge_count_;
        }
    }

    void ModuleGraph::add_unresolved(const fs::path& from, std::string specifier, Error error) {
        add_module(from).unresolved.push_back(UnresolvedRequest{std::move(specifier), std::move(error)});
    }

    void ModuleGraph::mark_failed(const fs::path& path) {
        add_module(path).failed = true;
    }

    void ModuleGraph::mark_entry(const fs::path& path) {
        add_module(path).entry = true;
    }

    void ModuleGraph::link(const fs::path& path) {
        const auto it = nodes_.find(path);
        if (it == nodes_.end()) {
            return;
        }

        for (const auto& record : it->second.records) {
            for (const auto& request : record->requests) {
                for (const auto& edge : it->second.edges) {
                    if (edge.specifier != request.specifier) {
                        continue;
                    }
                    const auto target = nodes_.find(edge.target);
                    if (target == nodes_.end()) {
                        continue;
                    }
                    if (const ModuleRecord* linked = target->second.link_target()) {
                        record->loaded_modules[request.specifier] = linked;
                    }
                    break;
                }
            }
        }
    }

    void ModuleGraph::release_edges(const fs::path& path) {
        const auto it = nodes_.find(path);
        if (it == nodes_.end()) {
            return;
        }

        for (const auto& target : successors_[path]) {
            predecessors_[target].erase(path);
            --edge_count_;
        }
        successors_[path].clear();
        it->second.edges.clear();
        it->second.edges_released = true;
    }

    bool ModuleGraph::has_module(const fs::path& path) const {
        return nodes_.contains(path);
    }

    const ModuleNode* ModuleGraph::find(const fs::path& path) const {
        const auto it = nodes_.find(path);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    bool ModuleGraph::has_edge(const fs::path& from, const fs::path& to) const {
        const auto it = successors_.find(from);
        if (it == successors_.end()) return false;
        return it->second.contains(to);
    }

    std::vector<fs::path> ModuleGraph::modules() const {
        std::vector<fs::path> result;
        result.reserve(nodes_.size());
        for (const auto& [path, node] : nodes_) {
            result.push_back(path);
        }
        return result;
    }

    std::vector<fs::path> ModuleGraph::successors(const fs::path& path) const {
        std::vector<fs::path> result;
        if (const auto it = successors_.find(path); it != successors_.end()) {
            result.assign(it->second.begin(), it->second.end());
        }
        return result;
    }

    std::vector<fs::path> ModuleGraph::predecessors(const fs::path& path) const {
        std::vector<fs::path> result;
        if (const auto it = predecessors_.find(path); it != predecessors_.end()) {
            result.assign(it->second.begin(), it->second.end());
        }
        return result;
    }

    std::optional<std::vector<fs::path>> ModuleGraph::find_path(
        const fs::path& from,
        const fs::path& to
    ) const {
        if (!has_module(from) || !has_module(to)) {
            return std::nullopt;
        }

        std::map<fs::path, fs::path> parent;
        std::deque<fs::path> queue;
        queue.push_back(from);
        parent.emplace(from, fs::path{});

        while (!queue.empty()) {
            fs::path current = std::move(queue.front());
            queue.pop_front();

            if (current == to) {
                std::vector<fs::path> path;
                for (fs::path p = to; ; p = parent.at(p)) {
                    path.push_back(p);
                    if (p == from) break;
                }
                std::reverse(path.begin(), path.end());
                return path;
            }

            const auto it = successors_.find(current);
            if (it == successors_.end()) continue;
            for (const auto& succ : it->second) {
                if (parent.try_emplace(succ, current).second) {
                    queue.push_back(succ);
                }
            }
        }

        return std::nullopt;
    }

    GraphStats ModuleGraph::stats() const {
        GraphStats stats;
        stats.node_count = nodes_.size();
        stats.edge_count = edge_count_;
        for (const auto& [path, node] : nodes_) {
            if (node.failed) ++stats.failed_count;
            if (node.entry) ++stats.entry_count;
            stats.unresolved_count += node.unresolved.size();
        }
        return stats;
    }

}  // namespace modlint::graph
