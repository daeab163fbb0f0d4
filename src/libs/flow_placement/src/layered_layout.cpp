#include <flow_placement/layered_layout.hpp>
#include <flow_model/log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <queue>
#include <set>

namespace flow_placement {

namespace {

using flow_model::Flow;
using flow_model::Node;
using flow_model::Size;

using EdgeList = std::vector<std::pair<int, int>>;

// One entry per laid-out vertex. Real vertices point back into the flow's node
// array; virtual vertices split edges that span more than one rank.
struct Vertex {
    int node = -1;
    std::string group;
    double primary = 0.0; // extent along the rank axis
    double perp = 0.0;    // extent across it
    int rank = 0;
    int order = 0;
    double coord = 0.0;   // perpendicular center
    std::vector<int> preds;
    std::vector<int> succs;

    bool is_virtual() const { return node < 0; }
};

struct Graph {
    std::vector<Vertex> vertices;
    std::vector<std::vector<int>> layers;
};

// Reverses every DFS back edge and drops the duplicates that creates.
EdgeList break_cycles(int count, const EdgeList& edges) {
    std::vector<std::vector<int>> out(count);
    for (const auto& [s, t] : edges) out[s].push_back(t);

    std::vector<int> state(count, 0); // 0 new, 1 on stack, 2 done
    std::set<std::pair<int, int>> reversed;
    for (int root = 0; root < count; ++root) {
        if (state[root] != 0) continue;
        std::vector<std::pair<int, std::size_t>> stack{ { root, 0 } };
        state[root] = 1;
        while (!stack.empty()) {
            auto& [v, next] = stack.back();
            if (next < out[v].size()) {
                const int w = out[v][next++];
                if (state[w] == 1) {
                    reversed.insert({ v, w });
                } else if (state[w] == 0) {
                    state[w] = 1;
                    stack.push_back({ w, 0 });
                }
            } else {
                state[v] = 2;
                stack.pop_back();
            }
        }
    }

    EdgeList acyclic;
    std::set<std::pair<int, int>> seen;
    for (const auto& e : edges) {
        const auto directed = reversed.count(e) ? std::make_pair(e.second, e.first) : e;
        if (seen.insert(directed).second) acyclic.push_back(directed);
    }
    return acyclic;
}

// Longest path from the sources (Kahn). Expects an acyclic edge list.
std::vector<int> longest_path_ranks(int count, const EdgeList& edges) {
    std::vector<std::vector<int>> out(count);
    std::vector<int> indegree(count, 0);
    for (const auto& [s, t] : edges) {
        out[s].push_back(t);
        ++indegree[t];
    }

    std::vector<int> rank(count, 0);
    std::queue<int> ready;
    for (int v = 0; v < count; ++v) {
        if (indegree[v] == 0) ready.push(v);
    }
    while (!ready.empty()) {
        const int v = ready.front();
        ready.pop();
        for (int w : out[v]) {
            rank[w] = std::max(rank[w], rank[v] + 1);
            if (--indegree[w] == 0) ready.push(w);
        }
    }
    return rank;
}

// Closest placement to desired that keeps the given order and minimum center
// gaps (gaps[i] separates i and i+1). Pool-adjacent-violators on shifted targets.
std::vector<double> place_in_order(const std::vector<double>& desired, const std::vector<double>& gaps) {
    const std::size_t n = desired.size();
    std::vector<double> offset(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) offset[i] = offset[i - 1] + gaps[i - 1];

    struct Block {
        double sum;
        std::size_t count;
    };
    std::vector<Block> blocks;
    for (std::size_t i = 0; i < n; ++i) {
        blocks.push_back({ desired[i] - offset[i], 1 });
        while (blocks.size() >= 2) {
            const Block& last = blocks.back();
            const Block& prev = blocks[blocks.size() - 2];
            if (prev.sum / static_cast<double>(prev.count) <= last.sum / static_cast<double>(last.count)) break;
            const Block merged{ prev.sum + last.sum, prev.count + last.count };
            blocks.pop_back();
            blocks.back() = merged;
        }
    }

    std::vector<double> placed;
    placed.reserve(n);
    for (const auto& b : blocks) {
        const double value = b.sum / static_cast<double>(b.count);
        for (std::size_t k = 0; k < b.count; ++k) placed.push_back(value + offset[placed.size()]);
    }
    return placed;
}

double default_gap(const Vertex& a, const Vertex& b, double node_sep) {
    return (a.perp + b.perp) * 0.5 + node_sep;
}

void reorder_layer(Graph& g, std::vector<int>& layer, bool use_preds) {
    std::vector<std::pair<double, int>> keyed;
    keyed.reserve(layer.size());
    for (int v : layer) {
        const auto& neighbours = use_preds ? g.vertices[v].preds : g.vertices[v].succs;
        double key = static_cast<double>(g.vertices[v].order);
        if (!neighbours.empty()) {
            double sum = 0.0;
            for (int w : neighbours) sum += g.vertices[w].order;
            key = sum / static_cast<double>(neighbours.size());
        }
        keyed.push_back({ key, v });
    }
    std::stable_sort(keyed.begin(), keyed.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    // Pull members of one group together at the slot of their first member.
    std::unordered_map<std::string, std::size_t> first_slot;
    std::vector<std::pair<std::size_t, std::size_t>> clustered;
    for (std::size_t i = 0; i < keyed.size(); ++i) {
        const Vertex& v = g.vertices[keyed[i].second];
        std::size_t key = i;
        if (!v.is_virtual() && !v.group.empty()) key = first_slot.emplace(v.group, i).first->second;
        clustered.push_back({ key, i });
    }
    std::sort(clustered.begin(), clustered.end());

    for (std::size_t i = 0; i < clustered.size(); ++i) {
        layer[i] = keyed[clustered[i].second].second;
        g.vertices[layer[i]].order = static_cast<int>(i);
    }
}

void align_layer(Graph& g, const std::vector<int>& layer, bool use_preds, double node_sep) {
    if (layer.empty()) return;
    std::vector<double> desired;
    std::vector<double> gaps;
    for (std::size_t i = 0; i < layer.size(); ++i) {
        const Vertex& v = g.vertices[layer[i]];
        const auto& neighbours = use_preds ? v.preds : v.succs;
        double target = v.coord;
        if (!neighbours.empty()) {
            double sum = 0.0;
            for (int w : neighbours) sum += g.vertices[w].coord;
            target = sum / static_cast<double>(neighbours.size());
        }
        desired.push_back(target);
        if (i > 0) gaps.push_back(default_gap(g.vertices[layer[i - 1]], v, node_sep));
    }
    const auto placed = place_in_order(desired, gaps);
    for (std::size_t i = 0; i < layer.size(); ++i) g.vertices[layer[i]].coord = placed[i];
}

struct ComponentPlacement {
    std::vector<int> nodes;           // flow node indices
    std::vector<double> primary;      // rank-axis centers
    std::vector<double> perp;         // perpendicular centers
    double perp_min = 0.0;
    double perp_max = 0.0;
};

class ComponentLayout {
public:
    ComponentLayout(const Flow& flow, const LayoutOptions& options, const flow_model::DimensionsFn& dims)
        : flow_(flow), options_(options), dims_(dims) {}

    ComponentPlacement run(const std::vector<int>& members, const EdgeList& edges);

private:
    void build_vertices(const std::vector<int>& members, const EdgeList& edges);
    void order_layers();
    void assign_coordinates();
    void compact_members(const std::vector<int>& members);
    void follow_chains();
    void resolve_overlaps();
    double gap(int a, int b) const;

    const Flow& flow_;
    const LayoutOptions& options_;
    const flow_model::DimensionsFn& dims_;
    Graph g_;
    std::unordered_map<int, std::string> compaction_key_;
};

ComponentPlacement ComponentLayout::run(const std::vector<int>& members, const EdgeList& edges) {
    build_vertices(members, edges);
    order_layers();
    assign_coordinates();
    compact_members(members);
    follow_chains();
    resolve_overlaps();

    ComponentPlacement placement;
    std::vector<double> rank_extent(g_.layers.size(), 0.0);
    for (const auto& v : g_.vertices) rank_extent[v.rank] = std::max(rank_extent[v.rank], v.primary);
    std::vector<double> rank_center(g_.layers.size(), 0.0);
    for (std::size_t r = 0; r < rank_center.size(); ++r) {
        rank_center[r] = r == 0
            ? rank_extent[0] * 0.5
            : rank_center[r - 1] + rank_extent[r - 1] * 0.5 + options_.spacing.rank_sep + rank_extent[r] * 0.5;
    }

    placement.perp_min = std::numeric_limits<double>::infinity();
    placement.perp_max = -std::numeric_limits<double>::infinity();
    for (const auto& v : g_.vertices) {
        if (v.is_virtual()) continue;
        placement.nodes.push_back(v.node);
        placement.primary.push_back(rank_center[v.rank]);
        placement.perp.push_back(v.coord);
        placement.perp_min = std::min(placement.perp_min, v.coord - v.perp * 0.5);
        placement.perp_max = std::max(placement.perp_max, v.coord + v.perp * 0.5);
    }
    return placement;
}

void ComponentLayout::build_vertices(const std::vector<int>& members, const EdgeList& edges) {
    const bool horizontal = options_.direction == LayoutDirection::LeftToRight;
    const int count = static_cast<int>(members.size());

    for (int node : members) {
        const Node& n = flow_.nodes[node];
        const Size size = dims_(n);
        Vertex v;
        v.node = node;
        v.group = n.parent_group_id.value_or("");
        v.primary = horizontal ? size.width : size.height;
        v.perp = horizontal ? size.height : size.width;
        g_.vertices.push_back(std::move(v));
    }

    const EdgeList acyclic = break_cycles(count, edges);
    const auto ranks = longest_path_ranks(count, acyclic);
    int max_rank = 0;
    for (int i = 0; i < count; ++i) {
        g_.vertices[i].rank = ranks[i];
        max_rank = std::max(max_rank, ranks[i]);
    }

    auto link = [this](int s, int t) {
        g_.vertices[s].succs.push_back(t);
        g_.vertices[t].preds.push_back(s);
    };
    for (const auto& [s, t] : acyclic) {
        int previous = s;
        for (int r = ranks[s] + 1; r < ranks[t]; ++r) {
            Vertex dummy;
            dummy.rank = r;
            g_.vertices.push_back(std::move(dummy));
            const int id = static_cast<int>(g_.vertices.size()) - 1;
            link(previous, id);
            previous = id;
        }
        link(previous, t);
    }

    g_.layers.assign(max_rank + 1, {});
    for (int v = 0; v < static_cast<int>(g_.vertices.size()); ++v) {
        auto& layer = g_.layers[g_.vertices[v].rank];
        g_.vertices[v].order = static_cast<int>(layer.size());
        layer.push_back(v);
    }
}

void ComponentLayout::order_layers() {
    const int last = static_cast<int>(g_.layers.size()) - 1;
    for (int iter = 0; iter < layout::ordering_sweeps; ++iter) {
        for (int r = 1; r <= last; ++r) reorder_layer(g_, g_.layers[r], true);
        for (int r = last - 1; r >= 0; --r) reorder_layer(g_, g_.layers[r], false);
    }
}

void ComponentLayout::assign_coordinates() {
    const double node_sep = options_.spacing.node_sep;

    // 1. Pack each layer and center it on zero.
    for (const auto& layer : g_.layers) {
        double cursor = 0.0;
        for (std::size_t i = 0; i < layer.size(); ++i) {
            if (i > 0) cursor += default_gap(g_.vertices[layer[i - 1]], g_.vertices[layer[i]], node_sep);
            g_.vertices[layer[i]].coord = cursor;
        }
        for (int v : layer) g_.vertices[v].coord -= cursor * 0.5;
    }

    // 2. Alternate toward predecessor and successor averages, finishing downward.
    const int last = static_cast<int>(g_.layers.size()) - 1;
    for (int iter = 0; iter < layout::coordinate_sweeps; ++iter) {
        for (int r = 1; r <= last; ++r) align_layer(g_, g_.layers[r], true, node_sep);
        for (int r = last - 1; r >= 0; --r) align_layer(g_, g_.layers[r], false, node_sep);
    }
    for (int r = 1; r <= last; ++r) align_layer(g_, g_.layers[r], true, node_sep);
}

void ComponentLayout::compact_members(const std::vector<int>& members) {
    RankMap ranks;
    for (const auto& v : g_.vertices) {
        if (!v.is_virtual()) ranks.emplace(flow_.nodes[v.node].id, v.rank);
    }
    const RankMap depth = build_depth_map(flow_.nodes, ranks);

    std::map<std::pair<std::string, int>, std::vector<int>> buckets;
    for (int i = 0; i < static_cast<int>(members.size()); ++i) {
        const Vertex& v = g_.vertices[i];
        if (v.group.empty()) continue;
        auto d = depth.find(flow_.nodes[v.node].id);
        if (d == depth.end()) continue;
        buckets[{ v.group, d->second }].push_back(i);
    }

    const double member_gap = options_.spacing.member_gap;
    for (auto& [key, bucket] : buckets) {
        if (bucket.size() < 2) continue;
        std::sort(bucket.begin(), bucket.end(), [this](int a, int b) {
            const Vertex& va = g_.vertices[a];
            const Vertex& vb = g_.vertices[b];
            return va.coord != vb.coord ? va.coord < vb.coord : va.order < vb.order;
        });

        double mean = 0.0;
        for (int v : bucket) mean += g_.vertices[v].coord;
        mean /= static_cast<double>(bucket.size());

        std::vector<double> offsets{ 0.0 };
        for (std::size_t i = 1; i < bucket.size(); ++i) {
            const double step = std::max(member_gap,
                (g_.vertices[bucket[i - 1]].perp + g_.vertices[bucket[i]].perp) * 0.5);
            offsets.push_back(offsets.back() + step);
        }
        const double start = mean - offsets.back() * 0.5;
        const std::string tag = key.first + '\n' + std::to_string(key.second);
        for (std::size_t i = 0; i < bucket.size(); ++i) {
            g_.vertices[bucket[i]].coord = start + offsets[i];
            compaction_key_[bucket[i]] = tag;
        }
    }
}

double ComponentLayout::gap(int a, int b) const {
    const Vertex& va = g_.vertices[a];
    const Vertex& vb = g_.vertices[b];
    auto ka = compaction_key_.find(a);
    auto kb = compaction_key_.find(b);
    if (ka != compaction_key_.end() && kb != compaction_key_.end() && ka->second == kb->second)
        return std::max(options_.spacing.member_gap, (va.perp + vb.perp) * 0.5);
    return default_gap(va, vb, options_.spacing.node_sep);
}

void ComponentLayout::follow_chains() {
    for (std::size_t r = 1; r < g_.layers.size(); ++r) {
        for (int v : g_.layers[r]) {
            Vertex& vertex = g_.vertices[v];
            if (compaction_key_.count(v) || vertex.preds.size() != 1) continue;
            const Vertex& parent = g_.vertices[vertex.preds.front()];
            if (parent.succs.size() != 1) continue;

            const double target = parent.coord;
            bool fits = true;
            if (!vertex.is_virtual()) {
                for (int w : g_.layers[r]) {
                    if (w == v || g_.vertices[w].is_virtual()) continue;
                    if (std::abs(target - g_.vertices[w].coord) < gap(v, w) - layout::epsilon) {
                        fits = false;
                        break;
                    }
                }
            }
            if (fits) vertex.coord = target;
        }
    }
}

void ComponentLayout::resolve_overlaps() {
    for (const auto& layer : g_.layers) {
        std::vector<int> real;
        for (int v : layer) {
            if (!g_.vertices[v].is_virtual()) real.push_back(v);
        }
        std::stable_sort(real.begin(), real.end(),
            [this](int a, int b) { return g_.vertices[a].coord < g_.vertices[b].coord; });
        for (std::size_t i = 1; i < real.size(); ++i) {
            const double min_coord = g_.vertices[real[i - 1]].coord + gap(real[i - 1], real[i]);
            if (g_.vertices[real[i]].coord < min_coord - layout::epsilon) g_.vertices[real[i]].coord = min_coord;
        }
    }
}

// Edges between visible nodes, keyed by visible slot (visible[slot] is the node index).
// Per source, targets inside a group come first (sorted by group) so grouped children
// stay contiguous.
EdgeList visible_edges(const Flow& flow, const std::vector<int>& visible,
    const std::unordered_map<std::string, int>& slot)
{
    struct Entry {
        int target;
        std::string group;
        std::size_t index;
    };
    std::vector<int> source_order;
    std::unordered_map<int, std::vector<Entry>> by_source;
    std::set<std::pair<int, int>> seen;

    for (std::size_t i = 0; i < flow.edges.size(); ++i) {
        const auto& e = flow.edges[i];
        auto s = slot.find(e.source);
        auto t = slot.find(e.target);
        if (s == slot.end() || t == slot.end() || s->second == t->second) continue;
        if (!seen.insert({ s->second, t->second }).second) continue;

        auto [bucket, inserted] = by_source.try_emplace(s->second);
        if (inserted) source_order.push_back(s->second);
        const Node& target = flow.nodes[visible[t->second]];
        bucket->second.push_back({ t->second, target.parent_group_id.value_or(""), i });
    }

    EdgeList edges;
    for (int source : source_order) {
        auto& bucket = by_source[source];
        std::stable_sort(bucket.begin(), bucket.end(), [](const Entry& a, const Entry& b) {
            const bool grouped_a = !a.group.empty();
            const bool grouped_b = !b.group.empty();
            if (grouped_a != grouped_b) return grouped_a;
            if (a.group != b.group) return a.group < b.group;
            return a.index < b.index;
        });
        for (const auto& entry : bucket) edges.push_back({ source, entry.target });
    }
    return edges;
}

int find_root(std::vector<int>& parent, int v) {
    while (parent[v] != v) {
        parent[v] = parent[parent[v]];
        v = parent[v];
    }
    return v;
}

} // namespace

RankMap assign_ranks(const std::vector<std::string>& ids,
    const std::vector<std::pair<std::string, std::string>>& edges)
{
    std::unordered_map<std::string, int> slot;
    for (const auto& id : ids) slot.emplace(id, static_cast<int>(slot.size()));

    EdgeList indexed;
    std::set<std::pair<int, int>> seen;
    for (const auto& [s, t] : edges) {
        auto si = slot.find(s);
        auto ti = slot.find(t);
        if (si == slot.end() || ti == slot.end() || si->second == ti->second) continue;
        if (seen.insert({ si->second, ti->second }).second) indexed.push_back({ si->second, ti->second });
    }

    const int count = static_cast<int>(slot.size());
    const auto ranks = longest_path_ranks(count, break_cycles(count, indexed));
    RankMap out;
    for (const auto& [id, index] : slot) out.emplace(id, ranks[index]);
    return out;
}

RankMap build_depth_map(const std::vector<Node>& nodes, const RankMap& ranks) {
    std::unordered_map<std::string, int> lowest;
    for (const auto& n : nodes) {
        auto r = ranks.find(n.id);
        if (r == ranks.end()) continue;
        const std::string group = n.parent_group_id.value_or("");
        auto [it, inserted] = lowest.emplace(group, r->second);
        if (!inserted) it->second = std::min(it->second, r->second);
    }

    RankMap depth;
    for (const auto& n : nodes) {
        auto r = ranks.find(n.id);
        if (r == ranks.end()) continue;
        depth.emplace(n.id, r->second - lowest[n.parent_group_id.value_or("")]);
    }
    return depth;
}

Flow layout_flow(const Flow& flow, const LayoutOptions& options) {
    Flow out = flow;

    // 1. Visible nodes, grouped by parent and otherwise in input order.
    std::vector<int> visible;
    for (int i = 0; i < static_cast<int>(flow.nodes.size()); ++i) {
        if (!flow.nodes[i].hidden) visible.push_back(i);
    }
    if (visible.empty()) return out;
    std::stable_sort(visible.begin(), visible.end(), [&flow](int a, int b) {
        return flow.nodes[a].parent_group_id.value_or("") < flow.nodes[b].parent_group_id.value_or("");
    });

    std::unordered_map<std::string, int> slot;
    for (int i = 0; i < static_cast<int>(visible.size()); ++i) slot.emplace(flow.nodes[visible[i]].id, i);
    const EdgeList edges = visible_edges(flow, visible, slot);

    // 2. Connected components, in order of their first visible node.
    std::vector<int> parent(visible.size());
    std::iota(parent.begin(), parent.end(), 0);
    for (const auto& [s, t] : edges) parent[find_root(parent, s)] = find_root(parent, t);

    std::vector<int> component_order;
    std::unordered_map<int, std::vector<int>> component_slots;
    for (int i = 0; i < static_cast<int>(visible.size()); ++i) {
        const int root = find_root(parent, i);
        auto [it, inserted] = component_slots.try_emplace(root);
        if (inserted) component_order.push_back(root);
        it->second.push_back(i);
    }

    const flow_model::DimensionsFn dims = options.dimensions
        ? options.dimensions
        : flow_model::DimensionsFn(flow_model::NodeDimensions{});
    const bool horizontal = options.direction == LayoutDirection::LeftToRight;

    // 3. Lay out each component and stack them across the rank axis.
    double cursor = 0.0;
    for (int root : component_order) {
        const auto& slots = component_slots[root];
        std::unordered_map<int, int> local;
        std::vector<int> members;
        for (int s : slots) {
            local.emplace(s, static_cast<int>(members.size()));
            members.push_back(visible[s]);
        }
        EdgeList local_edges;
        for (const auto& [s, t] : edges) {
            if (local.count(s)) local_edges.push_back({ local[s], local[t] });
        }

        ComponentLayout component(flow, options, dims);
        const ComponentPlacement placed = component.run(members, local_edges);
        const double shift = cursor - placed.perp_min;

        for (std::size_t i = 0; i < placed.nodes.size(); ++i) {
            Node& n = out.nodes[placed.nodes[i]];
            const Size size = dims(n);
            const double primary = placed.primary[i];
            const double perp = placed.perp[i] + shift;
            n.position = horizontal
                ? flow_model::Position{ primary - size.width * 0.5, perp - size.height * 0.5 }
                : flow_model::Position{ perp - size.width * 0.5, primary - size.height * 0.5 };
        }
        cursor += (placed.perp_max - placed.perp_min) + options.spacing.component_gap;
    }

    flow_model::engine_logger()->debug("layout_flow visible={} edges={} components={} direction={}",
        visible.size(), edges.size(), component_order.size(), horizontal ? "LR" : "TB");
    return out;
}

} // namespace flow_placement
