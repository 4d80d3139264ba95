#pragma once

#include "crypto/crypto.h"
#include <string>
#include <vector>
#include <cstdint>

namespace curator {
namespace crypto {

// leaf = H(H(address || count || unitId...)), integers big-endian.
Hash256 ownershipLeaf(const std::string& address, const std::vector<uint64_t>& unitIds);

// Order-independent: the smaller hash is hashed first.
Hash256 hashPair(const Hash256& a, const Hash256& b);

Hash256 processProof(const Hash256& leaf, const std::vector<Hash256>& proof);
bool verifyProof(const Hash256& root, const Hash256& leaf, const std::vector<Hash256>& proof);

class MerkleTree {
public:
    MerkleTree();
    explicit MerkleTree(std::vector<Hash256> leaves);

    Hash256 root() const;
    std::vector<Hash256> proof(size_t leafIndex) const;
    size_t leafCount() const;
    bool empty() const;

private:
    // levels_[0] are the leaves, levels_.back() holds the root.
    std::vector<std::vector<Hash256>> levels_;
};

class EligibilityOracle {
public:
    virtual ~EligibilityOracle() = default;
    virtual bool verify(const Hash256& root,
                        const std::string& address,
                        const std::vector<uint64_t>& unitIds,
                        const std::vector<Hash256>& proof) const = 0;
};

class MerkleEligibilityOracle : public EligibilityOracle {
public:
    bool verify(const Hash256& root,
                const std::string& address,
                const std::vector<uint64_t>& unitIds,
                const std::vector<Hash256>& proof) const override;

    static bool hasDuplicateUnits(const std::vector<uint64_t>& unitIds);
};

}
}
