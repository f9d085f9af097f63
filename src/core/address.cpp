#include "credrank/address.hpp"

namespace credrank {
namespace detail {

void validate_address_part(std::string_view part, const char* kind) {
    if (part.find('\0') != std::string_view::npos) {
        throw InvalidArgumentError(std::string(kind) + " part contains a NUL byte", __func__,
                                   "address parts must not contain the separator character");
    }
}

std::string display_address(const std::string& raw, const char* kind) {
    std::string out = kind;
    out += '[';
    bool first = true;
    std::size_t begin = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '\0') continue;
        if (!first) out += ',';
        out += '"';
        out.append(raw, begin, i - begin);
        out += '"';
        first = false;
        begin = i + 1;
    }
    out += ']';
    return out;
}

} // namespace detail
} // namespace credrank
