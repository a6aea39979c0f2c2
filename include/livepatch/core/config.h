#ifndef LIVEPATCH_CORE_CONFIG_H
#define LIVEPATCH_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace livepatch::core::config {

// Reserved tag reported by text nodes.
inline constexpr const char kTextTag[] = "#text";

// Attribute carrying the system-assigned identity of an element.
inline constexpr const char kIdentityAttribute[] = "data-dj-id";

// Attribute carrying the author-assigned list key.
inline constexpr const char kKeyAttribute[] = "data-key";

// Container marker: children are re-created instead of diffed.
inline constexpr const char kReplaceAllAttribute[] = "data-dj-replace";

inline constexpr const char kIdentityAlphabet[] =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline constexpr std::uint64_t kIdentityRadix = 62;

inline constexpr std::size_t kDefaultMaxDepth = 512;
inline constexpr std::size_t kMaxWireDepth = 1024;

}  // namespace livepatch::core::config

#endif  // LIVEPATCH_CORE_CONFIG_H
