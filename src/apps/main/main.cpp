// flow_groups_cli: group hierarchy, visibility and layout over editor flow JSON (C++20)
#include <flow_groups/group_commands.hpp>
#include <flow_groups/halos.hpp>
#include <flow_groups/validation.hpp>
#include <flow_groups/visibility.hpp>
#include <flow_loaders/debug_flow.hpp>
#include <flow_loaders/json_loader.hpp>
#include <flow_loaders/settings.hpp>
#include <flow_model/log.hpp>
#include <flow_placement/layered_layout.hpp>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    (void)fprintf(stderr,
        "usage: flow_groups_cli [--input file] [--settings file] [--log-file file] [--verbose] <command>\n"
        "commands:\n"
        "  refresh\n"
        "  validate\n"
        "  group <id> <id>... [--label text] [--expanded]\n"
        "  ungroup <group>\n"
        "  toggle <group> [--collapse|--expand]\n"
        "  attach <node> <group>\n"
        "  detach <node>\n"
        "  subtree <node> --collapse|--expand\n"
        "  layout [--direction LR|TB]\n"
        "  halos\n");
}

int print_result(const flow_groups::CommandResult& result) {
    if (!result.success || !result.updated_flow) {
        (void)fprintf(stderr, "error: %s\n", result.error.c_str());
        return 1;
    }
    (void)printf("%s\n", flow_loaders::flow_to_json_string(*result.updated_flow).c_str());
    return 0;
}

bool has_flag(const std::vector<std::string>& args, const char* flag) {
    for (const auto& a : args) {
        if (a == flag) return true;
    }
    return false;
}

// Value after flag, if present.
std::optional<std::string> flag_value(const std::vector<std::string>& args, const char* flag) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag) return args[i + 1];
    }
    return std::nullopt;
}

// Arguments that are neither flags nor flag values.
std::vector<std::string> positional(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--label" || args[i] == "--direction") {
            ++i;
            continue;
        }
        if (args[i].rfind("--", 0) == 0) continue;
        out.push_back(args[i]);
    }
    return out;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string input_path;
    std::string settings_path;
    std::string log_path;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (!command.empty()) {
            args.push_back(arg);
        } else if ((arg == "--input" || arg == "--settings" || arg == "--log-file") && i + 1 < argc) {
            std::string& target = arg == "--input" ? input_path : arg == "--settings" ? settings_path : log_path;
            target = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            (void)fprintf(stderr, "unknown option: %s\n", arg.c_str());
            print_usage();
            return 1;
        } else {
            command = arg;
        }
    }
    if (command.empty()) {
        print_usage();
        return 1;
    }

    if (log_path.empty())
        log_path = (flow_model::find_project_root() / "logs" / "flow_groups.log").string();
    auto logger = flow_model::configure_engine_logger(log_path,
        verbose ? spdlog::level::debug : spdlog::level::info);

    flow_loaders::EngineSettings settings;
    if (!settings_path.empty()) {
        auto loaded = flow_loaders::load_engine_settings_from_json_file(settings_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot read settings from %s\n", settings_path.c_str());
            return 1;
        }
        settings = std::move(*loaded);
    }

    flow_model::Flow flow;
    if (input_path.empty()) {
        flow = flow_loaders::generate_debug_flow();
        logger->info("No --input given, using the debug flow");
    } else {
        auto loaded = flow_loaders::load_flow_from_json_file(input_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot read flow from %s\n", input_path.c_str());
            return 1;
        }
        flow = std::move(*loaded);
    }
    logger->info("Command {} on {} nodes, {} edges", command, flow.nodes.size(), flow.edges.size());

    const auto operands = positional(args);

    if (command == "refresh") {
        const auto refreshed = flow_groups::refresh_flow(flow);
        logger->info("refresh changed={}", refreshed.changed);
        (void)printf("%s\n", flow_loaders::flow_to_json_string(refreshed.flow).c_str());
        return 0;
    }
    if (command == "validate") {
        const auto report = flow_groups::validate_hierarchy(flow.nodes);
        for (const auto& issue : report.issues)
            (void)printf("%s\t%s\t%s\n", issue.code.c_str(), issue.node_id.c_str(), issue.message.c_str());
        if (report.ok()) (void)printf("ok\n");
        return report.ok() ? 0 : 1;
    }
    if (command == "group") {
        flow_groups::CreateGroupRequest request;
        request.member_ids = operands;
        request.label = flag_value(args, "--label");
        request.collapse = !has_flag(args, "--expanded");
        return print_result(flow_groups::create_group_command(flow, request));
    }
    if (command == "ungroup" && operands.size() == 1)
        return print_result(flow_groups::ungroup_command(flow, operands[0]));
    if (command == "toggle" && operands.size() == 1) {
        std::optional<bool> expand;
        if (has_flag(args, "--expand")) expand = true;
        if (has_flag(args, "--collapse")) expand = false;
        return print_result(flow_groups::toggle_group_command(flow, operands[0], expand));
    }
    if (command == "attach" && operands.size() == 2)
        return print_result(flow_groups::attach_command(flow, operands[0], operands[1]));
    if (command == "detach" && operands.size() == 1)
        return print_result(flow_groups::detach_command(flow, operands[0]));
    if (command == "subtree" && operands.size() == 1
        && has_flag(args, "--collapse") != has_flag(args, "--expand"))
    {
        return print_result(flow_groups::collapse_subtree_command(flow, operands[0], has_flag(args, "--collapse")));
    }
    if (command == "layout") {
        auto options = settings.layout_options();
        if (auto dir = flag_value(args, "--direction")) {
            if (*dir == "LR") {
                options.direction = flow_placement::LayoutDirection::LeftToRight;
            } else if (*dir == "TB") {
                options.direction = flow_placement::LayoutDirection::TopToBottom;
            } else {
                (void)fprintf(stderr, "unknown direction: %s\n", dir->c_str());
                return 1;
            }
        }
        const auto laid_out = flow_placement::layout_flow(flow_groups::apply_group_visibility(flow), options);
        (void)printf("%s\n", flow_loaders::flow_to_json_string(laid_out).c_str());
        return 0;
    }
    if (command == "halos") {
        const auto visible = flow_groups::apply_group_visibility(flow);
        auto halos = flow_groups::compute_halos(visible.nodes, settings.dimensions, settings.halo_padding);
        flow_groups::sort_halos_by_area(halos);
        (void)printf("%s\n", flow_loaders::halos_to_json_string(halos).c_str());
        return 0;
    }

    (void)fprintf(stderr, "bad command or arguments: %s\n", command.c_str());
    print_usage();
    return 1;
}
