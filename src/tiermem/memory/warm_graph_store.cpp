/**
 * @file warm_graph_store.cpp
 * @brief Per-owner entity/topic/summary graph for the warm tier
 *
 * Each owner has an independent graph: nodes keyed by id, a label index for
 * de-duplication, directed typed edges and an undirected adjacency set used
 * by the breadth-first context traversal. A single shared_mutex guards all
 * graphs; retrieval takes it shared.
 */

#include "tiermem/memory/warm_graph_store.h"
#include "tiermem/common/logger.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <sstream>

namespace tiermem {
namespace memory {

namespace {

const char* const kNodeTypeNames[] = {"entity", "topic", "summary"};
const char* const kRelationKindNames[] = {"relates_to", "mentions", "discussed_with", "summary_of"};

std::string summary_label(const core::SessionId& session) {
    return "session:" + session;
}

// Normalized, non-empty, first-occurrence order
std::vector<std::string> distinct_labels(const std::vector<std::string>& labels) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& label : labels) {
        std::string key = core::normalize_label(label);
        if (key.empty() || !seen.insert(key).second) {
            continue;
        }
        out.push_back(label);
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

const char* node_type_name(NodeType type) {
    return kNodeTypeNames[static_cast<size_t>(type)];
}

const char* relation_kind_name(RelationKind kind) {
    return kRelationKindNames[static_cast<size_t>(kind)];
}

WarmGraphStore::WarmGraphStore(const core::WarmGraphConfig& config, std::shared_ptr<core::Clock> clock)
    : config_(config), clock_(clock ? std::move(clock) : core::default_clock()) {
    if (config_.max_context_nodes == 0) {
        throw core::InvalidArgumentError("Warm graph max_context_nodes must be greater than 0");
    }
}

// ============================================================================
// GRAPH CONSTRUCTION
// ============================================================================

core::NodeId WarmGraphStore::upsert_node_locked(OwnerGraph& graph, const core::OwnerId& owner,
                                                NodeType node_type, const std::string& label,
                                                const std::string& payload, double weight,
                                                core::Timestamp now) {
    LabelKey key(node_type, core::normalize_label(label));
    auto indexed = graph.label_index.find(key);
    if (indexed != graph.label_index.end()) {
        GraphNode& node = graph.nodes.at(indexed->second);
        node.weight += weight;
        node.updated_at = now;
        if (node.payload.empty() && !payload.empty()) {
            node.payload = payload;
        }
        return node.node_id;
    }

    GraphNode node;
    node.node_id = next_node_id_.fetch_add(1, std::memory_order_relaxed);
    node.owner_id = owner;
    node.node_type = node_type;
    node.label = trim(label);
    node.payload = payload;
    node.weight = weight;
    node.created_at = now;
    node.updated_at = now;

    core::NodeId id = node.node_id;
    graph.label_index.emplace(std::move(key), id);
    graph.nodes.emplace(id, std::move(node));
    return id;
}

core::Result<core::NodeId> WarmGraphStore::create_node(const core::OwnerId& owner,
                                                       NodeType node_type,
                                                       const std::string& label,
                                                       const std::string& payload,
                                                       double weight) {
    if (owner.empty()) {
        return core::Result<core::NodeId>::error("owner id must not be empty",
                                                 core::Error::Code::INVALID_ARGUMENT);
    }
    if (core::normalize_label(label).empty()) {
        return core::Result<core::NodeId>::error("node label must not be empty",
                                                 core::Error::Code::INVALID_ARGUMENT);
    }
    if (!std::isfinite(weight) || weight < 0.0) {
        return core::Result<core::NodeId>::error("node weight must be finite and non-negative",
                                                 core::Error::Code::INVALID_ARGUMENT);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& graph = graphs_[owner];
    return core::Result<core::NodeId>(
        upsert_node_locked(graph, owner, node_type, label, payload, weight, clock_->now()));
}

void WarmGraphStore::set_edge_locked(OwnerGraph& graph, core::NodeId a, core::NodeId b,
                                     RelationKind kind, double strength, core::Timestamp now) {
    GraphEdge& edge = graph.edges[EdgeKey(a, b, kind)];
    edge.from = a;
    edge.to = b;
    edge.relation_kind = kind;
    edge.strength = strength;
    edge.updated_at = now;
    graph.adjacency[a].insert(b);
    graph.adjacency[b].insert(a);
}

void WarmGraphStore::reinforce_edge_locked(OwnerGraph& graph, core::NodeId a, core::NodeId b,
                                           RelationKind kind, double base_strength,
                                           core::Timestamp now) {
    auto it = graph.edges.find(EdgeKey(a, b, kind));
    if (it == graph.edges.end()) {
        set_edge_locked(graph, a, b, kind, base_strength, now);
        return;
    }
    it->second.strength = std::min(1.0, it->second.strength + config_.reinforce_step);
    it->second.updated_at = now;
}

core::Result<void> WarmGraphStore::link(const core::OwnerId& owner,
                                        core::NodeId a,
                                        core::NodeId b,
                                        RelationKind relation_kind,
                                        double strength) {
    if (!std::isfinite(strength) || strength < 0.0 || strength > 1.0) {
        return core::Result<void>::error("edge strength must lie in [0, 1]",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    if (a == b) {
        return core::Result<void>::error("self-loops are not allowed",
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    if (it == graphs_.end() || !it->second.nodes.count(a) || !it->second.nodes.count(b)) {
        return core::Result<void>::error("node not found for owner " + owner,
                                         core::Error::Code::NOT_FOUND);
    }
    set_edge_locked(it->second, a, b, relation_kind, strength, clock_->now());
    return core::Result<void>();
}

std::string WarmGraphStore::append_excerpt(const std::string& summary, const std::string& text) const {
    std::string excerpt = trim(text);
    if (excerpt.size() > config_.summary_excerpt_chars) {
        excerpt = excerpt.substr(0, config_.summary_excerpt_chars);
    }
    std::string combined = summary.empty() ? excerpt : summary + " | " + excerpt;
    if (combined.size() > config_.summary_max_chars) {
        combined.resize(config_.summary_max_chars);
    }
    return combined;
}

core::Result<void> WarmGraphStore::absorb(const core::MemoryItem& item) {
    if (item.owner_id.empty()) {
        return core::Result<void>::error("owner id must not be empty",
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& graph = graphs_[item.owner_id];
    core::Timestamp now = clock_->now();

    auto add_source = [&graph, &item](core::NodeId id) {
        GraphNode& node = graph.nodes.at(id);
        if (std::find(node.source_items.begin(), node.source_items.end(), item.id) ==
            node.source_items.end()) {
            node.source_items.push_back(item.id);
        }
        node.orphaned = false;
    };

    core::NodeId summary_id = upsert_node_locked(graph, item.owner_id, NodeType::SUMMARY,
                                                 summary_label(item.session_id), "",
                                                 item.importance, now);
    GraphNode& summary = graph.nodes.at(summary_id);
    summary.payload = append_excerpt(summary.payload, item.content.text);
    add_source(summary_id);

    std::vector<core::NodeId> entity_ids;
    for (const auto& entity : distinct_labels(item.content.entities)) {
        core::NodeId id = upsert_node_locked(graph, item.owner_id, NodeType::ENTITY, entity, "",
                                             item.importance, now);
        add_source(id);
        entity_ids.push_back(id);
    }
    std::vector<core::NodeId> topic_ids;
    for (const auto& topic : distinct_labels(item.content.topics)) {
        core::NodeId id = upsert_node_locked(graph, item.owner_id, NodeType::TOPIC, topic, "",
                                             item.importance, now);
        add_source(id);
        topic_ids.push_back(id);
    }

    for (core::NodeId entity : entity_ids) {
        reinforce_edge_locked(graph, summary_id, entity, RelationKind::MENTIONS,
                              config_.mention_strength, now);
    }
    for (core::NodeId topic : topic_ids) {
        reinforce_edge_locked(graph, summary_id, topic, RelationKind::RELATES_TO,
                              config_.topic_strength, now);
    }
    for (core::NodeId entity : entity_ids) {
        for (core::NodeId topic : topic_ids) {
            reinforce_edge_locked(graph, entity, topic, RelationKind::RELATES_TO,
                                  config_.entity_topic_strength, now);
        }
    }
    for (size_t i = 0; i < entity_ids.size(); ++i) {
        for (size_t j = i + 1; j < entity_ids.size(); ++j) {
            reinforce_edge_locked(graph, entity_ids[i], entity_ids[j], RelationKind::DISCUSSED_WITH,
                                  config_.co_mention_strength, now);
        }
    }

    core::MemoryItem resident = item;
    resident.tier = core::Tier::WARM;
    graph.items[item.id] = std::move(resident);

    TIERMEM_DEBUG("Warm graph absorbed item {} of owner {} ({} entities, {} topics)",
                  item.id, item.owner_id, entity_ids.size(), topic_ids.size());
    return core::Result<void>();
}

// ============================================================================
// RETRIEVAL
// ============================================================================

std::optional<core::NodeId> WarmGraphStore::select_anchor_locked(
    const OwnerGraph& graph, const std::optional<std::string>& hint) const {
    const GraphNode* best = nullptr;

    if (!hint || core::normalize_label(*hint).empty()) {
        for (const auto& [id, node] : graph.nodes) {
            if (node.node_type != NodeType::SUMMARY) {
                continue;
            }
            if (!best || node.updated_at > best->updated_at ||
                (node.updated_at == best->updated_at && node.node_id > best->node_id)) {
                best = &node;
            }
        }
        return best ? std::optional<core::NodeId>(best->node_id) : std::nullopt;
    }

    std::string needle = core::normalize_label(*hint);
    // Lower rank wins: exact topic, exact entity, substring topic, substring entity
    int best_rank = 4;
    for (const auto& [id, node] : graph.nodes) {
        if (node.node_type == NodeType::SUMMARY) {
            continue;
        }
        std::string label = core::normalize_label(node.label);
        int rank;
        if (label == needle) {
            rank = node.node_type == NodeType::TOPIC ? 0 : 1;
        } else if (label.find(needle) != std::string::npos) {
            rank = node.node_type == NodeType::TOPIC ? 2 : 3;
        } else {
            continue;
        }
        if (rank < best_rank ||
            (rank == best_rank && (node.weight > best->weight ||
                                   (node.weight == best->weight && node.node_id < best->node_id)))) {
            best = &node;
            best_rank = rank;
        }
    }
    return best ? std::optional<core::NodeId>(best->node_id) : std::nullopt;
}

std::vector<ContextNode> WarmGraphStore::query_context(const core::OwnerId& owner,
                                                       const std::optional<std::string>& topic_hint,
                                                       uint32_t max_hops) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ContextNode> result;
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return result;
    }
    const OwnerGraph& graph = it->second;

    auto anchor = select_anchor_locked(graph, topic_hint);
    if (!anchor) {
        return result;
    }

    // Breadth-first search gives shortest hop distances
    std::unordered_map<core::NodeId, uint32_t> distance;
    std::deque<core::NodeId> frontier;
    distance[*anchor] = 0;
    frontier.push_back(*anchor);
    while (!frontier.empty()) {
        core::NodeId current = frontier.front();
        frontier.pop_front();
        uint32_t d = distance[current];
        if (d >= max_hops) {
            continue;
        }
        auto adj = graph.adjacency.find(current);
        if (adj == graph.adjacency.end()) {
            continue;
        }
        for (core::NodeId next : adj->second) {
            if (distance.emplace(next, d + 1).second) {
                frontier.push_back(next);
            }
        }
    }

    for (const auto& [id, d] : distance) {
        const GraphNode& node = graph.nodes.at(id);
        if (node.orphaned) {
            continue;
        }
        result.push_back(ContextNode{node, d});
    }
    std::sort(result.begin(), result.end(), [](const ContextNode& a, const ContextNode& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        if (a.node.weight != b.node.weight) return a.node.weight > b.node.weight;
        if (a.node.updated_at != b.node.updated_at) return a.node.updated_at > b.node.updated_at;
        return a.node.node_id < b.node.node_id;
    });
    if (result.size() > config_.max_context_nodes) {
        result.resize(config_.max_context_nodes);
    }
    return result;
}

std::optional<GraphNode> WarmGraphStore::get_node(const core::OwnerId& owner, core::NodeId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return std::nullopt;
    }
    auto node = it->second.nodes.find(id);
    if (node == it->second.nodes.end()) {
        return std::nullopt;
    }
    return node->second;
}

std::optional<core::NodeId> WarmGraphStore::find_node(const core::OwnerId& owner, NodeType node_type,
                                                      const std::string& label) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return std::nullopt;
    }
    auto indexed = it->second.label_index.find(LabelKey(node_type, core::normalize_label(label)));
    if (indexed == it->second.label_index.end()) {
        return std::nullopt;
    }
    return indexed->second;
}

std::vector<GraphNode> WarmGraphStore::nodes(const core::OwnerId& owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<GraphNode> out;
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return out;
    }
    for (const auto& [id, node] : it->second.nodes) {
        out.push_back(node);
    }
    std::sort(out.begin(), out.end(),
              [](const GraphNode& a, const GraphNode& b) { return a.node_id < b.node_id; });
    return out;
}

std::vector<GraphEdge> WarmGraphStore::edges(const core::OwnerId& owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<GraphEdge> out;
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return out;
    }
    for (const auto& [key, edge] : it->second.edges) {
        out.push_back(edge);
    }
    return out;
}

// ============================================================================
// WARM-RESIDENT ITEMS
// ============================================================================

std::optional<core::MemoryItem> WarmGraphStore::get_item(const core::OwnerId& owner,
                                                         core::ItemId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return std::nullopt;
    }
    auto item = it->second.items.find(id);
    if (item == it->second.items.end()) {
        return std::nullopt;
    }
    return item->second;
}

std::vector<core::MemoryItem> WarmGraphStore::items(const core::OwnerId& owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::MemoryItem> out;
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return out;
    }
    for (const auto& [id, item] : it->second.items) {
        out.push_back(item);
    }
    std::sort(out.begin(), out.end(), [](const core::MemoryItem& a, const core::MemoryItem& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

std::vector<core::MemoryItem> WarmGraphStore::aged_items(const core::OwnerId& owner,
                                                         core::Timestamp cutoff) const {
    std::vector<core::MemoryItem> aged;
    for (auto& item : items(owner)) {
        if (item.created_at < cutoff) {
            aged.push_back(std::move(item));
        }
    }
    return aged;
}

std::optional<core::MemoryItem> WarmGraphStore::take_item(const core::OwnerId& owner, core::ItemId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return std::nullopt;
    }
    auto item = it->second.items.find(id);
    if (item == it->second.items.end()) {
        return std::nullopt;
    }
    core::MemoryItem taken = std::move(item->second);
    it->second.items.erase(item);
    return taken;
}

size_t WarmGraphStore::forget_item(const core::OwnerId& owner, core::ItemId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return 0;
    }
    OwnerGraph& graph = it->second;
    graph.items.erase(id);

    size_t orphaned = 0;
    for (auto& [node_id, node] : graph.nodes) {
        auto ref = std::find(node.source_items.begin(), node.source_items.end(), id);
        if (ref == node.source_items.end()) {
            continue;
        }
        node.source_items.erase(ref);
        if (node.source_items.empty() && !node.orphaned) {
            node.orphaned = true;
            ++orphaned;
        }
    }
    if (orphaned > 0) {
        TIERMEM_DEBUG("Forgetting item {} orphaned {} warm nodes of owner {}", id, orphaned, owner);
    }
    return orphaned;
}

bool WarmGraphStore::update_importance(const core::OwnerId& owner, core::ItemId id,
                                       const core::ImportanceSignals& signals, double importance) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    if (it == graphs_.end()) {
        return false;
    }
    auto item = it->second.items.find(id);
    if (item == it->second.items.end()) {
        return false;
    }
    item->second.signals = signals;
    item->second.importance = importance;
    return true;
}

// ============================================================================
// STATISTICS
// ============================================================================

size_t WarmGraphStore::node_count(const core::OwnerId& owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    return it == graphs_.end() ? 0 : it->second.nodes.size();
}

size_t WarmGraphStore::edge_count(const core::OwnerId& owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    return it == graphs_.end() ? 0 : it->second.edges.size();
}

size_t WarmGraphStore::item_count(const core::OwnerId& owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = graphs_.find(owner);
    return it == graphs_.end() ? 0 : it->second.items.size();
}

size_t WarmGraphStore::item_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [owner, graph] : graphs_) {
        total += graph.items.size();
    }
    return total;
}

std::vector<core::OwnerId> WarmGraphStore::owners() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::OwnerId> out;
    out.reserve(graphs_.size());
    for (const auto& [owner, graph] : graphs_) {
        out.push_back(owner);
    }
    return out;
}

std::string WarmGraphStore::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t nodes = 0;
    size_t edges = 0;
    size_t items = 0;
    size_t orphaned = 0;
    for (const auto& [owner, graph] : graphs_) {
        nodes += graph.nodes.size();
        edges += graph.edges.size();
        items += graph.items.size();
        for (const auto& [id, node] : graph.nodes) {
            if (node.orphaned) ++orphaned;
        }
    }
    std::ostringstream oss;
    oss << "WarmGraphStore Stats:\n";
    oss << "  Owners: " << graphs_.size() << "\n";
    oss << "  Nodes: " << nodes << " (" << orphaned << " orphaned)\n";
    oss << "  Edges: " << edges << "\n";
    oss << "  Resident items: " << items << "\n";
    return oss.str();
}

} // namespace memory
} // namespace tiermem
