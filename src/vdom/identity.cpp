#include <livepatch/vdom/identity.h>
#include <livepatch/core/config.h>

#include <algorithm>

namespace livepatch::vdom {

std::string encode_base62(std::uint64_t value) {
    if (value == 0) return std::string(1, core::config::kIdentityAlphabet[0]);

    std::string out;
    while (value > 0) {
        out += core::config::kIdentityAlphabet[value % core::config::kIdentityRadix];
        value /= core::config::kIdentityRadix;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string IdentityCounter::next() {
    return encode_base62(next_++);
}

} // namespace livepatch::vdom
