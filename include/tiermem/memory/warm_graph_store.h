#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "tiermem/core/clock.h"
#include "tiermem/core/config.h"
#include "tiermem/core/result.h"
#include "tiermem/core/types.h"

namespace tiermem {
namespace memory {

enum class NodeType : uint8_t {
    ENTITY = 0,
    TOPIC = 1,
    SUMMARY = 2
};

enum class RelationKind : uint8_t {
    RELATES_TO = 0,
    MENTIONS = 1,
    DISCUSSED_WITH = 2,
    SUMMARY_OF = 3
};

const char* node_type_name(NodeType type);
const char* relation_kind_name(RelationKind kind);

/**
 * @brief A vertex of an owner's warm graph
 *
 * source_items are weak back-references: the ids of the items whose content
 * produced or reinforced this node. A node whose every source item has been
 * forgotten is marked orphaned and is never deleted.
 */
struct GraphNode {
    core::NodeId node_id = 0;
    core::OwnerId owner_id;
    NodeType node_type = NodeType::ENTITY;
    std::string label;
    std::string payload;
    double weight = 0.0;
    core::Timestamp created_at = 0;
    core::Timestamp updated_at = 0;
    bool orphaned = false;
    std::vector<core::ItemId> source_items;
};

struct GraphEdge {
    core::NodeId from = 0;
    core::NodeId to = 0;
    RelationKind relation_kind = RelationKind::RELATES_TO;
    double strength = 0.0;
    core::Timestamp updated_at = 0;
};

/**
 * @brief A node returned by query_context with its hop distance from the anchor
 */
struct ContextNode {
    GraphNode node;
    uint32_t distance = 0;
};

/**
 * @brief Per-owner graph of entities, topics and session summaries
 *
 * The store also holds the live copy of every warm-resident MemoryItem so the
 * controller can demote it later. Nodes and edges are append/update only.
 */
class WarmGraphStore {
public:
    WarmGraphStore(const core::WarmGraphConfig& config, std::shared_ptr<core::Clock> clock);

    WarmGraphStore(const WarmGraphStore&) = delete;
    WarmGraphStore& operator=(const WarmGraphStore&) = delete;

    // ============================================================================
    // GRAPH CONSTRUCTION
    // ============================================================================

    /**
     * @brief Create a node, or reinforce the existing one with the same label
     *
     * Entity and topic nodes are de-duplicated per owner by normalized label;
     * re-creating one adds weight to it and returns its id. Summary nodes are
     * de-duplicated the same way so that one session maps to one summary.
     *
     * @return INVALID_ARGUMENT for an empty owner or label or a negative weight
     */
    core::Result<core::NodeId> create_node(const core::OwnerId& owner,
                                           NodeType node_type,
                                           const std::string& label,
                                           const std::string& payload,
                                           double weight);

    /**
     * @brief Create or update the edge a -> b of the given kind
     * @return NOT_FOUND if either node does not belong to the owner,
     *         INVALID_ARGUMENT if strength is outside [0, 1] or a == b
     */
    core::Result<void> link(const core::OwnerId& owner,
                            core::NodeId a,
                            core::NodeId b,
                            RelationKind relation_kind,
                            double strength);

    /**
     * @brief Make an item warm-resident and fold its content into the graph
     *
     * Creates or reinforces one entity node per entity, one topic node per
     * topic and the summary node of the item's session, then links them:
     * summary -> entity (mentions), summary -> topic (relates_to),
     * entity -> topic (relates_to) and entity -> entity (discussed_with).
     */
    core::Result<void> absorb(const core::MemoryItem& item);

    // ============================================================================
    // RETRIEVAL
    // ============================================================================

    /**
     * @brief Nodes within max_hops of the anchor, nearest and heaviest first
     *
     * The anchor is the node whose label matches the hint (topic before
     * entity, exact before substring, heavier first) or, without a hint, the
     * most recently updated summary. Edges are followed in both directions.
     * Orphaned nodes are traversed but not returned. An unknown owner or an
     * unmatched hint yields an empty vector.
     */
    std::vector<ContextNode> query_context(const core::OwnerId& owner,
                                           const std::optional<std::string>& topic_hint,
                                           uint32_t max_hops) const;

    std::optional<GraphNode> get_node(const core::OwnerId& owner, core::NodeId id) const;
    std::optional<core::NodeId> find_node(const core::OwnerId& owner, NodeType node_type,
                                          const std::string& label) const;
    std::vector<GraphNode> nodes(const core::OwnerId& owner) const;
    std::vector<GraphEdge> edges(const core::OwnerId& owner) const;

    // ============================================================================
    // WARM-RESIDENT ITEMS
    // ============================================================================

    std::optional<core::MemoryItem> get_item(const core::OwnerId& owner, core::ItemId id) const;
    std::vector<core::MemoryItem> items(const core::OwnerId& owner) const;

    /**
     * @brief Items created before cutoff, oldest first
     */
    std::vector<core::MemoryItem> aged_items(const core::OwnerId& owner, core::Timestamp cutoff) const;

    /**
     * @brief Remove the live copy of an item, leaving its nodes untouched
     */
    std::optional<core::MemoryItem> take_item(const core::OwnerId& owner, core::ItemId id);

    /**
     * @brief Remove an item and every back-reference to it
     * @return Number of nodes that became orphaned
     */
    size_t forget_item(const core::OwnerId& owner, core::ItemId id);

    bool update_importance(const core::OwnerId& owner, core::ItemId id,
                           const core::ImportanceSignals& signals, double importance);

    // ============================================================================
    // STATISTICS
    // ============================================================================

    size_t node_count(const core::OwnerId& owner) const;
    size_t edge_count(const core::OwnerId& owner) const;
    size_t item_count(const core::OwnerId& owner) const;
    size_t item_count() const;
    std::vector<core::OwnerId> owners() const;
    std::string stats() const;

    const core::WarmGraphConfig& config() const { return config_; }

private:
    using EdgeKey = std::tuple<core::NodeId, core::NodeId, RelationKind>;
    using LabelKey = std::pair<NodeType, std::string>;

    struct OwnerGraph {
        std::unordered_map<core::NodeId, GraphNode> nodes;
        std::map<LabelKey, core::NodeId> label_index;
        std::map<EdgeKey, GraphEdge> edges;
        std::unordered_map<core::NodeId, std::set<core::NodeId>> adjacency;
        std::unordered_map<core::ItemId, core::MemoryItem> items;
    };

    core::NodeId upsert_node_locked(OwnerGraph& graph, const core::OwnerId& owner,
                                    NodeType node_type, const std::string& label,
                                    const std::string& payload, double weight,
                                    core::Timestamp now);
    void set_edge_locked(OwnerGraph& graph, core::NodeId a, core::NodeId b,
                         RelationKind kind, double strength, core::Timestamp now);
    void reinforce_edge_locked(OwnerGraph& graph, core::NodeId a, core::NodeId b,
                               RelationKind kind, double base_strength, core::Timestamp now);
    std::optional<core::NodeId> select_anchor_locked(const OwnerGraph& graph,
                                                     const std::optional<std::string>& hint) const;
    std::string append_excerpt(const std::string& summary, const std::string& text) const;

    core::WarmGraphConfig config_;
    std::shared_ptr<core::Clock> clock_;
    std::atomic<core::NodeId> next_node_id_{1};

    mutable std::shared_mutex mutex_;
    std::unordered_map<core::OwnerId, OwnerGraph> graphs_;
};

} // namespace memory
} // namespace tiermem
