#include <flow_loaders/debug_flow.hpp>
#include <initializer_list>

namespace flow_loaders {

flow_model::Flow generate_debug_flow() {
    flow_model::Flow out;

    auto add_node = [&](const char* id, const char* label, double x, double y, const char* parent = nullptr) {
        flow_model::Node n;
        n.id = id;
        n.label = label;
        n.position = { x, y };
        if (parent) n.parent_group_id = parent;
        out.nodes.push_back(std::move(n));
    };
    auto add_group = [&](const char* id, const char* label, bool collapsed, const char* parent = nullptr) {
        flow_model::Node g;
        g.id = id;
        g.kind = flow_model::NodeKind::Group;
        g.label = label;
        g.display_state = collapsed ? flow_model::GroupDisplayState::Collapsed : flow_model::GroupDisplayState::Expanded;
        if (parent) g.parent_group_id = parent;
        out.nodes.push_back(std::move(g));
    };
    auto add_edges = [&](const char* source, std::initializer_list<const char*> targets) {
        for (const char* target : targets) {
            flow_model::Edge e;
            e.id = std::string(source) + "-" + target;
            e.source = source;
            e.target = target;
            out.edges.push_back(std::move(e));
        }
    };

    add_node("vito", "Vito Corleone", 0, 200);
    add_node("sonny", "Sonny Corleone", 222, 40, "group-sonny");
    add_node("francesco", "Francesco Corleone", 444, 40, "group-sonny");
    add_node("sonny_heir", "Sonny's heir", 666, 40, "group-sonny");
    add_node("fredo", "Fredo Corleone", 222, 200);
    add_node("connie", "Connie Corleone", 222, 280);
    add_node("michael", "Michael Corleone", 222, 400, "group-michael");
    add_node("kay", "Kay Adams", 444, 400, "group-michael");
    add_node("kay_child", "Kay's child", 666, 400, "group-michael");
    add_node("anthony", "Anthony Corleone", 444, 520, "group-michael-children");
    add_node("mary", "Mary Corleone", 444, 600, "group-michael-children");
    add_node("tom", "Tom Hagen", 0, 600);
    add_node("lawyer", "Family lawyer", 222, 680);

    add_group("group-sonny", "Sonny lineage", false);
    add_group("group-michael", "Michael's family", false);
    add_group("group-michael-children", "Michael's children", true, "group-michael");

    add_edges("vito", { "sonny", "fredo", "connie", "michael" });
    add_edges("sonny", { "francesco" });
    add_edges("francesco", { "sonny_heir" });
    add_edges("michael", { "kay", "anthony", "mary" });
    add_edges("kay", { "kay_child" });
    add_edges("tom", { "lawyer" });

    return out;
}

} // namespace flow_loaders
