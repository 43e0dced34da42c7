#include <redline-cpp/resolve.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace redline_cpp {

namespace {

class Resolver {
public:
    explicit Resolver(const DecisionMap& decisions) : decisions_{decisions} {}

    void emit(const Node& node, std::string& out) const {
        std::visit(overload{
            [&](const RootNode& root) {
                for (const auto& child : root.children) emit(child, out);
            },
            [&](const ListNode& list) {
                auto items = std::string{};
                for (const auto& child : list.children) emit(child, items);
                if (items.empty()) return;
                open(to_string_view(list.kind), out);
                out += items;
                close(to_string_view(list.kind), out);
            },
            [&](const ListItemNode& item) {
                const auto accepted = is_accepted(item.id);
                const auto kept = survives(item.status, accepted);
                if (kept) {
                    open("li", out);
                    out += reading(item.content, accepted);
                }
                for (const auto& child : item.children) emit(child, out);
                if (kept) close("li", out);
            },
            [&](const BlockNode& block) {
                const auto accepted = is_accepted(block.id);
                if (!survives(block.status, accepted)) return;
                open(to_string_view(block.tag), out);
                out += reading(block.content, accepted);
                close(to_string_view(block.tag), out);
            },
        }, node.inner);
    }

private:
    auto is_accepted(const NodeId& id) const -> bool {
        const auto it = decisions_.find(id);
        return it != decisions_.end() && it->second == Decision::accept;
    }

    // False when the chosen side of the document does not contain the node.
    static auto survives(Status status, bool accepted) -> bool {
        if (status == Status::removed) return !accepted;
        if (status == Status::added) return accepted;
        return true;
    }

    static auto reading(const std::vector<InlinePart>& content, bool accepted) -> std::string {
        return join_parts(content, accepted ? Reading::modified : Reading::original);
    }

    static void open(std::string_view tag, std::string& out) {
        out.push_back('<');
        out += tag;
        out.push_back('>');
    }

    static void close(std::string_view tag, std::string& out) {
        out += "</";
        out += tag;
        out.push_back('>');
    }

    const DecisionMap& decisions_;
};

}  // anonymous namespace

auto resolve(const Node& tree, const DecisionMap& decisions) -> std::string {
    auto out = std::string{};
    Resolver{decisions}.emit(tree, out);
    return out;
}

}  // namespace redline_cpp
