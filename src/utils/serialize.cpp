#include "utils/serialize.h"
#include <stdexcept>

namespace curator {
namespace utils {

// Strings and byte blobs larger than this are treated as corrupt input.
static constexpr uint64_t MAX_BLOB_SIZE = 16 * 1024 * 1024;

ByteBuffer::ByteBuffer() : readPos_(0) {}

ByteBuffer::ByteBuffer(const std::vector<uint8_t>& data) : data_(data), readPos_(0) {}

void ByteBuffer::writeUint8(uint8_t value) {
    data_.push_back(value);
}

void ByteBuffer::writeUint32(uint32_t value) {
    for (int i = 3; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void ByteBuffer::writeUint64(uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void ByteBuffer::writeBool(bool value) {
    writeUint8(value ? 1 : 0);
}

void ByteBuffer::writeVarInt(uint64_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value));
}

void ByteBuffer::writeString(const std::string& value) {
    writeVarInt(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeBytes(const std::vector<uint8_t>& value) {
    writeVarInt(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeFixedBytes(const uint8_t* data, size_t length) {
    data_.insert(data_.end(), data, data + length);
}

void ByteBuffer::checkRead(size_t bytes) const {
    if (bytes > data_.size() - readPos_) {
        throw std::runtime_error("Buffer underflow");
    }
}

uint8_t ByteBuffer::readUint8() {
    checkRead(1);
    return data_[readPos_++];
}

uint32_t ByteBuffer::readUint32() {
    checkRead(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; i++) {
        value = (value << 8) | data_[readPos_++];
    }
    return value;
}

uint64_t ByteBuffer::readUint64() {
    checkRead(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | data_[readPos_++];
    }
    return value;
}

bool ByteBuffer::readBool() {
    uint8_t v = readUint8();
    if (v > 1) throw std::runtime_error("Invalid bool encoding");
    return v == 1;
}

uint64_t ByteBuffer::readVarInt() {
    uint64_t value = 0;
    int shift = 0;
    while (true) {
        if (shift > 63) throw std::runtime_error("VarInt overflow");
        uint8_t byte = readUint8();
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) break;
        shift += 7;
    }
    return value;
}

std::string ByteBuffer::readString() {
    uint64_t length = readVarInt();
    if (length > MAX_BLOB_SIZE) throw std::runtime_error("String too large");
    checkRead(static_cast<size_t>(length));
    std::string value(data_.begin() + readPos_, data_.begin() + readPos_ + length);
    readPos_ += length;
    return value;
}

std::vector<uint8_t> ByteBuffer::readBytes() {
    uint64_t length = readVarInt();
    if (length > MAX_BLOB_SIZE) throw std::runtime_error("Blob too large");
    checkRead(static_cast<size_t>(length));
    std::vector<uint8_t> value(data_.begin() + readPos_, data_.begin() + readPos_ + length);
    readPos_ += length;
    return value;
}

void ByteBuffer::readFixedBytes(uint8_t* out, size_t length) {
    checkRead(length);
    for (size_t i = 0; i < length; i++) {
        out[i] = data_[readPos_++];
    }
}

}
}
