// Fuzz target for the full pipeline — diff two documents split from the input,
// then merge under all-accept, all-reject and no decisions.
// Rejecting everything must give the same markup as deciding nothing.

#include <redline-cpp/redline.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto sep = input.find('\0');
    if (sep == std::string_view::npos) return 0;

    auto tree = redline_cpp::diff_html(input.substr(0, sep), input.substr(sep + 1));
    if (!tree) return 0;

    using redline_cpp::Decision;
    auto accepted = redline_cpp::resolve(*tree, redline_cpp::uniform_decisions(*tree, Decision::accept));
    auto rejected = redline_cpp::resolve(*tree, redline_cpp::uniform_decisions(*tree, Decision::reject));
    auto undecided = redline_cpp::resolve(*tree, {});
    (void)accepted;
    if (rejected != undecided) std::abort();
    return 0;
}
