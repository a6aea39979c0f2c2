#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace livepatch::core {

// Markup that cannot be tokenized at all (invalid UTF-8, NUL bytes).
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::size_t offset)
        : std::runtime_error(message + " at byte " + std::to_string(offset)),
          offset_(offset) {}

    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

// Element nesting beyond the configured limit.
class DepthExceeded : public std::runtime_error {
public:
    explicit DepthExceeded(std::size_t limit)
        : std::runtime_error("element nesting exceeds limit of " + std::to_string(limit)),
          limit_(limit) {}

    std::size_t limit() const { return limit_; }

private:
    std::size_t limit_;
};

// Malformed patch or node encoding.
class WireError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace livepatch::core
