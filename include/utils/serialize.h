#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>

namespace curator {
namespace utils {

// Big-endian fixed-width integers, LEB128 varints and varint-prefixed
// strings. Reads past the end throw std::runtime_error.
class ByteBuffer {
public:
    ByteBuffer();
    explicit ByteBuffer(const std::vector<uint8_t>& data);

    void writeUint8(uint8_t value);
    void writeUint32(uint32_t value);
    void writeUint64(uint64_t value);
    void writeBool(bool value);
    void writeVarInt(uint64_t value);
    void writeString(const std::string& value);
    void writeBytes(const std::vector<uint8_t>& value);
    void writeFixedBytes(const uint8_t* data, size_t length);

    template<size_t N>
    void writeArray(const std::array<uint8_t, N>& value) {
        writeFixedBytes(value.data(), N);
    }

    uint8_t readUint8();
    uint32_t readUint32();
    uint64_t readUint64();
    bool readBool();
    uint64_t readVarInt();
    std::string readString();
    std::vector<uint8_t> readBytes();
    void readFixedBytes(uint8_t* out, size_t length);

    template<size_t N>
    std::array<uint8_t, N> readArray() {
        std::array<uint8_t, N> out{};
        readFixedBytes(out.data(), N);
        return out;
    }

    const std::vector<uint8_t>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - readPos_; }
    bool atEnd() const { return readPos_ >= data_.size(); }

private:
    void checkRead(size_t bytes) const;

    std::vector<uint8_t> data_;
    size_t readPos_;
};

}
}
