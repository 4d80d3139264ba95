#pragma once

#include "core/types.h"
#include "crypto/merkle.h"
#include <map>
#include <string>
#include <vector>

namespace curator {
namespace core {

struct OwnershipRoots {
    crypto::Hash256 current{};
    crypto::Hash256 previous{};
    Timestamp updatedAt = 0;
    uint64_t updateCount = 0;

    bool hasCurrent() const { return !crypto::isZero(current); }
    void rotate(const crypto::Hash256& root, Timestamp now);
};

struct Holder {
    Address address;
    std::vector<uint64_t> unitIds;
};

// Holder list for the reference collection, as produced by the snapshot job.
class OwnershipSnapshot {
public:
    bool loadFile(const std::string& path, std::string* error = nullptr);
    bool loadJson(const std::string& text, std::string* error = nullptr);
    void addHolder(const Address& address, std::vector<uint64_t> unitIds);

    const std::vector<Holder>& holders() const { return holders_; }
    const Holder* find(const Address& address) const;
    uint64_t totalUnits() const;

    // Leaves follow holder order; build() must run after the last addHolder().
    void build();
    crypto::Hash256 root() const { return tree_.root(); }
    std::vector<crypto::Hash256> proofFor(const Address& address) const;

    std::string merkleJson() const;

private:
    std::vector<Holder> holders_;
    std::map<Address, size_t> index_;
    crypto::MerkleTree tree_;
};

}
}
