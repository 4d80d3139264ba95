#include "crypto/crypto.h"
#include <cstring>
#include <random>
#include <algorithm>

namespace curator {
namespace crypto {

static inline uint32_t rotr32(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }
static inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
static inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
static inline uint32_t bsig0(uint32_t x) { return rotr32(x, 2) ^ rotr32(x, 13) ^ rotr32(x, 22); }
static inline uint32_t bsig1(uint32_t x) { return rotr32(x, 6) ^ rotr32(x, 11) ^ rotr32(x, 25); }
static inline uint32_t ssig0(uint32_t x) { return rotr32(x, 7) ^ rotr32(x, 18) ^ (x >> 3); }
static inline uint32_t ssig1(uint32_t x) { return rotr32(x, 17) ^ rotr32(x, 19) ^ (x >> 10); }

static const uint32_t K256[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

Sha256::Sha256() : bufferLen_(0), totalLen_(0), finalized_(false) {
    static const uint32_t init[8] = {
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
    };
    std::memcpy(state_, init, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
}

void Sha256::transform(const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               static_cast<uint32_t>(block[i * 4 + 3]);
    }
    for (int i = 16; i < 64; i++) {
        w[i] = ssig1(w[i - 2]) + w[i - 7] + ssig0(w[i - 15]) + w[i - 16];
    }

    uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3];
    uint32_t e = state_[4], f = state_[5], g = state_[6], h = state_[7];

    for (int i = 0; i < 64; i++) {
        uint32_t t1 = h + bsig1(e) + ch(e, f, g) + K256[i] + w[i];
        uint32_t t2 = bsig0(a) + maj(a, b, c);
        h = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }

    state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d;
    state_[4] += e; state_[5] += f; state_[6] += g; state_[7] += h;
}

Sha256& Sha256::update(const uint8_t* data, size_t len) {
    if (finalized_) return *this;
    totalLen_ += len;
    while (len > 0) {
        size_t take = std::min(len, sizeof(buffer_) - bufferLen_);
        std::memcpy(buffer_ + bufferLen_, data, take);
        bufferLen_ += take;
        data += take;
        len -= take;
        if (bufferLen_ == sizeof(buffer_)) {
            transform(buffer_);
            bufferLen_ = 0;
        }
    }
    return *this;
}

Sha256& Sha256::update(const std::vector<uint8_t>& data) {
    return update(data.data(), data.size());
}

Sha256& Sha256::update(const std::string& data) {
    return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha256& Sha256::update(const Hash256& data) {
    return update(data.data(), data.size());
}

Hash256 Sha256::finalize() {
    Hash256 out{};
    if (!finalized_) {
        uint64_t bits = totalLen_ * 8;
        buffer_[bufferLen_++] = 0x80;
        if (bufferLen_ > 56) {
            std::memset(buffer_ + bufferLen_, 0, 64 - bufferLen_);
            transform(buffer_);
            bufferLen_ = 0;
        }
        std::memset(buffer_ + bufferLen_, 0, 56 - bufferLen_);
        for (int j = 0; j < 8; j++) {
            buffer_[56 + j] = static_cast<uint8_t>((bits >> (56 - j * 8)) & 0xff);
        }
        transform(buffer_);
        finalized_ = true;
    }
    for (int j = 0; j < 8; j++) {
        out[j * 4] = static_cast<uint8_t>((state_[j] >> 24) & 0xff);
        out[j * 4 + 1] = static_cast<uint8_t>((state_[j] >> 16) & 0xff);
        out[j * 4 + 2] = static_cast<uint8_t>((state_[j] >> 8) & 0xff);
        out[j * 4 + 3] = static_cast<uint8_t>(state_[j] & 0xff);
    }
    return out;
}

Hash256 sha256(const uint8_t* data, size_t len) {
    return Sha256().update(data, len).finalize();
}

Hash256 sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Hash256 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 doubleSha256(const std::vector<uint8_t>& data) {
    Hash256 first = sha256(data);
    return sha256(first.data(), first.size());
}

bool isZero(const Hash256& hash) {
    for (uint8_t b : hash) {
        if (b != 0) return false;
    }
    return true;
}

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    std::random_device rd;
    for (size_t i = 0; i < count; i++) {
        bytes[i] = static_cast<uint8_t>(rd() & 0xff);
    }
    return bytes;
}

std::string toHex(const uint8_t* data, size_t len) {
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result += hex[data[i] >> 4];
        result += hex[data[i] & 0x0f];
    }
    return result;
}

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool fromHex(const std::string& hex, std::vector<uint8_t>& out) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) start = 2;
    if ((hex.size() - start) % 2 != 0) return false;

    std::vector<uint8_t> result;
    result.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out = std::move(result);
    return true;
}

bool parseHash256(const std::string& hex, Hash256& out) {
    std::vector<uint8_t> bytes;
    if (!fromHex(hex, bytes) || bytes.size() != SHA256_SIZE) return false;
    std::memcpy(out.data(), bytes.data(), SHA256_SIZE);
    return true;
}

}
}
