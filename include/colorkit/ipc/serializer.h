#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace colorkit::ipc {

// Big-endian writer for message payloads. Strings and byte blobs carry a
// u32 length prefix.
class Serializer {
public:
    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_f64(double value);
    void write_bool(bool value);
    void write_string(std::string_view str);
    void write_bytes(const uint8_t* data, size_t len);

    // Appends bytes verbatim, without a length prefix.
    void write_raw(const std::vector<uint8_t>& bytes);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take_data() { return std::move(buffer_); }

private:
    template <typename T>
    void write_be(T value);

    std::vector<uint8_t> buffer_;
};

// Reader matching Serializer. Every read throws std::runtime_error when the
// buffer runs short.
class Deserializer {
public:
    explicit Deserializer(const uint8_t* data, size_t size);
    explicit Deserializer(const std::vector<uint8_t>& data);

    uint8_t read_u8();
    uint32_t read_u32();
    uint64_t read_u64();
    double read_f64();
    bool read_bool();
    std::string read_string();
    std::vector<uint8_t> read_bytes();

    // Reads exactly len bytes with no length prefix.
    std::vector<uint8_t> read_raw(size_t len);

    bool has_remaining() const;
    size_t remaining() const;

private:
    template <typename T>
    T read_be();

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;

    void check_remaining(size_t needed) const;
};

} // namespace colorkit::ipc
