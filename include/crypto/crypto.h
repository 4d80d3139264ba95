#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace curator {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;

class Sha256 {
public:
    Sha256();
    Sha256& update(const uint8_t* data, size_t len);
    Sha256& update(const std::vector<uint8_t>& data);
    Sha256& update(const std::string& data);
    Sha256& update(const Hash256& data);
    Hash256 finalize();

private:
    void transform(const uint8_t block[64]);

    uint32_t state_[8];
    uint8_t buffer_[64];
    size_t bufferLen_;
    uint64_t totalLen_;
    bool finalized_;
};

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);
Hash256 doubleSha256(const std::vector<uint8_t>& data);

bool isZero(const Hash256& hash);
std::vector<uint8_t> randomBytes(size_t count);

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}

// Strict decoding: optional "0x" prefix, even length, hex digits only.
bool fromHex(const std::string& hex, std::vector<uint8_t>& out);
bool parseHash256(const std::string& hex, Hash256& out);

}
}
