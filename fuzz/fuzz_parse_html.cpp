// Fuzz target for parse_html() — exercises libxml2 recovery and tree building.
// Resolving a parsed tree with no decisions must be deterministic.

#include <redline-cpp/redline.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto html = std::string_view{reinterpret_cast<const char*>(data), size};

    auto tree = redline_cpp::parse_html(html);
    if (tree) {
        auto markup = redline_cpp::resolve(*tree, {});
        auto again = redline_cpp::resolve(*tree, {});
        if (markup != again) std::abort();
    }
    return 0;
}
