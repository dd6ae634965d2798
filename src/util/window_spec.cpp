#include "util/window_spec.hpp"

#include <charconv>

namespace gzinspect {

namespace {

std::optional<std::size_t> ParseCount(std::string_view s) {
    std::size_t v = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last || s.empty()) return std::nullopt;
    return v;
}

} // namespace

WindowSpec ParseWindowSpec(std::string_view arg) {
    WindowSpec spec;
    const auto colon = arg.find(':');
    const std::string_view head = arg.substr(0, colon);
    spec.head = ParseCount(head).value_or(kDefaultWindowHead);
    if (colon != std::string_view::npos) {
        std::string_view rest = arg.substr(colon + 1);
        rest = rest.substr(0, rest.find(':'));
        spec.tail = ParseCount(rest);
    }
    return spec;
}

} // namespace gzinspect
