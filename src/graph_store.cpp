#include "graph_store.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include <algorithm>
#include <deque>
#include <unordered_set>

namespace memweave {

std::vector<MemoryNode> GraphStore::traverse(const std::string& node_id,
                                             const std::vector<RelationType>& types,
                                             uint32_t depth,
                                             const std::string& ns) {
    std::vector<MemoryNode> result;
    if (depth == 0) return result;

    std::unordered_set<std::string> visited{node_id};
    std::deque<std::pair<std::string, uint32_t>> frontier;
    frontier.emplace_back(node_id, 0);

    while (!frontier.empty()) {
        auto [current, hops] = frontier.front();
        frontier.pop_front();
        if (hops >= depth) continue;

        for (const auto& edge : edges(current, ns)) {
            if (!types.empty() &&
                std::find(types.begin(), types.end(), edge.relation_type) == types.end()) {
                continue;
            }
            const std::string& other =
                edge.source_id == current ? edge.target_id : edge.source_id;
            if (!visited.insert(other).second) continue;

            auto node = get_node(other, ns);
            if (!node) continue;
            frontier.emplace_back(other, hops + 1);
            result.push_back(std::move(*node));
        }
    }
    return result;
}

std::unique_ptr<GraphStore> create_graph_store(const Config& config,
                                               const BackendRegistry& registry) {
    return registry.create_store(config.store.backend, config);
}

} // namespace memweave
