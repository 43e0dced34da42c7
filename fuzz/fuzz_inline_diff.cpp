// Fuzz target for inline_diff() — splits the input in two and diffs the halves
// at every granularity. Both readings must reproduce their input exactly.

#include <redline-cpp/inline_diff.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;

    const auto split = static_cast<std::size_t>(data[0]) % size;
    const auto text = std::string_view{reinterpret_cast<const char*>(data) + 1, size - 1};
    const auto a = text.substr(0, split);
    const auto b = text.substr(split);

    using redline_cpp::Granularity;
    for (const auto g : {Granularity::word, Granularity::character, Granularity::line}) {
        const auto parts = redline_cpp::inline_diff(a, b, redline_cpp::DiffOptions{g});
        if (redline_cpp::original_text(parts) != a) std::abort();
        if (redline_cpp::modified_text(parts) != b) std::abort();
    }
    return 0;
}
