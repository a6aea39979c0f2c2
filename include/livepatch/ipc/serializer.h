#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace livepatch::ipc {

// Big-endian byte writer for the patch wire format.
class Serializer {
public:
    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_bool(bool value);
    // u32 length prefix followed by the raw bytes.
    void write_string(std::string_view str);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take_data() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

// Reader over a borrowed buffer. Every read throws core::WireError when the
// buffer is shorter than the value being read.
class Deserializer {
public:
    explicit Deserializer(const uint8_t* data, size_t size);
    explicit Deserializer(const std::vector<uint8_t>& data);

    uint8_t read_u8();
    uint32_t read_u32();
    bool read_bool();
    std::string read_string();

    bool has_remaining() const;
    size_t remaining() const;
    size_t offset() const { return offset_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;

    void check_remaining(size_t needed) const;
};

} // namespace livepatch::ipc
