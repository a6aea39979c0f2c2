#include <livepatch/ipc/serializer.h>
#include <livepatch/core/error.h>

namespace livepatch::ipc {

// ---------------------------------------------------------------------------
// Serializer
// ---------------------------------------------------------------------------

void Serializer::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void Serializer::write_u32(uint32_t value) {
    buffer_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void Serializer::write_bool(bool value) {
    write_u8(value ? 1 : 0);
}

void Serializer::write_string(std::string_view str) {
    write_u32(static_cast<uint32_t>(str.size()));
    const auto* bytes = reinterpret_cast<const uint8_t*>(str.data());
    buffer_.insert(buffer_.end(), bytes, bytes + str.size());
}

// ---------------------------------------------------------------------------
// Deserializer
// ---------------------------------------------------------------------------

Deserializer::Deserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

Deserializer::Deserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

void Deserializer::check_remaining(size_t needed) const {
    if (needed > size_ - offset_) {
        throw core::WireError(
            "Deserializer underflow: need " + std::to_string(needed) +
            " bytes but only " + std::to_string(size_ - offset_) + " remaining");
    }
}

uint8_t Deserializer::read_u8() {
    check_remaining(1);
    return data_[offset_++];
}

uint32_t Deserializer::read_u32() {
    check_remaining(4);
    uint32_t value = static_cast<uint32_t>(data_[offset_]) << 24
                   | static_cast<uint32_t>(data_[offset_ + 1]) << 16
                   | static_cast<uint32_t>(data_[offset_ + 2]) << 8
                   | static_cast<uint32_t>(data_[offset_ + 3]);
    offset_ += 4;
    return value;
}

bool Deserializer::read_bool() {
    uint8_t value = read_u8();
    if (value > 1) {
        throw core::WireError("invalid bool byte " + std::to_string(value) +
                              " at offset " + std::to_string(offset_ - 1));
    }
    return value == 1;
}

std::string Deserializer::read_string() {
    uint32_t len = read_u32();
    check_remaining(len);
    std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return result;
}

bool Deserializer::has_remaining() const {
    return offset_ < size_;
}

size_t Deserializer::remaining() const {
    return size_ - offset_;
}

} // namespace livepatch::ipc
