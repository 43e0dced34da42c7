#include <redline-cpp/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace redline_cpp {

namespace {

// Read a string-named enum, throwing on anything unknown.
template <typename Enum, typename Parse>
auto enum_from_json(const nlohmann::json& j, Parse parse, std::string_view what) -> Enum {
    if (!j.is_string()) {
        throw std::runtime_error{std::string{what} + " must be a string"};
    }
    const auto& name = j.get_ref<const std::string&>();
    const std::optional<Enum> value = parse(name);
    if (!value) {
        throw std::runtime_error{"unknown " + std::string{what} + ": " + name};
    }
    return *value;
}

auto children_from_json(const nlohmann::json& j) -> std::vector<Node> {
    if (!j.contains("children")) return {};
    return j.at("children").get<std::vector<Node>>();
}

}  // anonymous namespace

// =============================================================================
// Enums
// =============================================================================

void to_json(nlohmann::json& j, Status status) {
    j = std::string{to_string_view(status)};
}

void from_json(const nlohmann::json& j, Status& status) {
    status = enum_from_json<Status>(j, parse_status, "status");
}

void to_json(nlohmann::json& j, BlockTag tag) {
    j = std::string{to_string_view(tag)};
}

void from_json(const nlohmann::json& j, BlockTag& tag) {
    tag = enum_from_json<BlockTag>(j, parse_block_tag, "block tag");
}

void to_json(nlohmann::json& j, ListKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ListKind& kind) {
    kind = enum_from_json<ListKind>(j, parse_list_kind, "list kind");
}

void to_json(nlohmann::json& j, Decision decision) {
    j = std::string{to_string_view(decision)};
}

void from_json(const nlohmann::json& j, Decision& decision) {
    if (j.is_null()) {
        decision = Decision::undecided;
        return;
    }
    decision = enum_from_json<Decision>(j, parse_decision, "decision");
}

void to_json(nlohmann::json& j, Granularity granularity) {
    j = std::string{to_string_view(granularity)};
}

void from_json(const nlohmann::json& j, Granularity& granularity) {
    granularity = enum_from_json<Granularity>(j, parse_granularity, "granularity");
}

// =============================================================================
// Compound types
// =============================================================================

void to_json(nlohmann::json& j, const InlinePart& part) {
    j = nlohmann::json{{"text", part.text}, {"added", part.added}, {"removed", part.removed}};
}

void from_json(const nlohmann::json& j, InlinePart& part) {
    part.text = j.at("text").get<std::string>();
    part.added = j.value("added", false);
    part.removed = j.value("removed", false);
    if (part.added && part.removed) {
        throw std::runtime_error{"inline part cannot be both added and removed"};
    }
}

void to_json(nlohmann::json& j, const Node& node) {
    std::visit(overload{
        [&](const RootNode& root) {
            j = nlohmann::json{{"type", "root"}, {"children", root.children}};
        },
        [&](const ListNode& list) {
            j = nlohmann::json{
                {"type", std::string{to_string_view(list.kind)}},
                {"children", list.children},
            };
        },
        [&](const ListItemNode& item) {
            j = nlohmann::json{
                {"type", "li"},
                {"id", item.id},
                {"status", item.status},
                {"content", item.content},
                {"children", item.children},
            };
        },
        [&](const BlockNode& block) {
            j = nlohmann::json{
                {"type", "block"},
                {"tag", block.tag},
                {"id", block.id},
                {"status", block.status},
                {"content", block.content},
            };
        },
    }, node.inner);
}

void from_json(const nlohmann::json& j, Node& node) {
    const auto type = j.at("type").get<std::string>();
    if (type == "root") {
        node = Node{RootNode{children_from_json(j)}};
    } else if (const auto kind = parse_list_kind(type)) {
        node = Node{ListNode{*kind, children_from_json(j)}};
    } else if (type == "li") {
        auto item = ListItemNode{};
        item.id = j.at("id").get<std::string>();
        item.status = j.at("status").get<Status>();
        item.content = j.at("content").get<std::vector<InlinePart>>();
        item.children = children_from_json(j);
        node = Node{std::move(item)};
    } else if (type == "block") {
        auto block = BlockNode{};
        block.tag = j.at("tag").get<BlockTag>();
        block.id = j.at("id").get<std::string>();
        block.status = j.at("status").get<Status>();
        block.content = j.at("content").get<std::vector<InlinePart>>();
        node = Node{std::move(block)};
    } else {
        throw std::runtime_error{"unknown node type: " + type};
    }
}

void to_json(nlohmann::json& j, const ReviewSummary& summary) {
    j = nlohmann::json{
        {"unchanged", summary.unchanged},
        {"added", summary.added},
        {"removed", summary.removed},
        {"changed", summary.changed},
        {"pending", summary.pending()},
    };
}

void to_json(nlohmann::json& j, const DiffOptions& options) {
    j = nlohmann::json{{"granularity", options.granularity}};
}

void from_json(const nlohmann::json& j, DiffOptions& options) {
    options = DiffOptions{};
    if (j.contains("granularity")) {
        options.granularity = j.at("granularity").get<Granularity>();
    }
}

// =============================================================================
// Export / import
// =============================================================================

auto export_json(const Node& tree) -> nlohmann::json {
    return nlohmann::json(tree);
}

auto import_json(const nlohmann::json& j) -> Node {
    try {
        return j.get<Node>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error{std::string{"malformed tree JSON: "} + e.what()};
    }
}

auto export_decisions(const DecisionMap& decisions) -> nlohmann::json {
    auto j = nlohmann::json::object();
    for (const auto& [id, decision] : decisions) {
        j[id] = decision;
    }
    return j;
}

auto import_decisions(const nlohmann::json& j) -> DecisionMap {
    if (!j.is_object()) {
        throw std::runtime_error{"decisions must be a JSON object"};
    }
    auto decisions = DecisionMap{};
    for (const auto& [id, value] : j.items()) {
        const auto decision = value.get<Decision>();
        if (decision == Decision::undecided) continue;
        decisions.emplace(id, decision);
    }
    return decisions;
}

}  // namespace redline_cpp
