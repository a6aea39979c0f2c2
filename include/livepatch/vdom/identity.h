#pragma once
#include <cstdint>
#include <string>

namespace livepatch::vdom {

// Base-62 rendering over 0-9a-zA-Z; 0 -> "0", 62 -> "10".
std::string encode_base62(std::uint64_t value);

// Monotonic source of node identities. One counter per render session;
// parsing two trees with the same counter yields disjoint identities.
class IdentityCounter {
public:
    IdentityCounter() = default;
    explicit IdentityCounter(std::uint64_t start) : next_(start) {}

    // Returns the next identity and advances.
    std::string next();

    // Value the next call to next() will encode.
    std::uint64_t peek() const { return next_; }

    void reset(std::uint64_t start = 0) { next_ = start; }

private:
    std::uint64_t next_ = 0;
};

} // namespace livepatch::vdom
