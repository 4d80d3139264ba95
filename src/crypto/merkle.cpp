#include "crypto/merkle.h"
#include "utils/serialize.h"
#include <algorithm>
#include <unordered_set>

namespace curator {
namespace crypto {

Hash256 ownershipLeaf(const std::string& address, const std::vector<uint64_t>& unitIds) {
    utils::ByteBuffer buf;
    buf.writeString(address);
    buf.writeUint64(unitIds.size());
    for (uint64_t id : unitIds) {
        buf.writeUint64(id);
    }
    return doubleSha256(buf.data());
}

Hash256 hashPair(const Hash256& a, const Hash256& b) {
    Sha256 h;
    if (a < b) {
        h.update(a).update(b);
    } else {
        h.update(b).update(a);
    }
    return h.finalize();
}

Hash256 processProof(const Hash256& leaf, const std::vector<Hash256>& proof) {
    Hash256 computed = leaf;
    for (const auto& sibling : proof) {
        computed = hashPair(computed, sibling);
    }
    return computed;
}

bool verifyProof(const Hash256& root, const Hash256& leaf, const std::vector<Hash256>& proof) {
    return processProof(leaf, proof) == root;
}

MerkleTree::MerkleTree() {}

MerkleTree::MerkleTree(std::vector<Hash256> leaves) {
    if (leaves.empty()) return;
    levels_.push_back(std::move(leaves));
    while (levels_.back().size() > 1) {
        const auto& level = levels_.back();
        std::vector<Hash256> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            const Hash256& left = level[i];
            const Hash256& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
            next.push_back(hashPair(left, right));
        }
        levels_.push_back(std::move(next));
    }
}

Hash256 MerkleTree::root() const {
    if (levels_.empty()) return Hash256{};
    return levels_.back()[0];
}

std::vector<Hash256> MerkleTree::proof(size_t leafIndex) const {
    std::vector<Hash256> out;
    if (levels_.empty() || leafIndex >= levels_[0].size()) return out;

    size_t index = leafIndex;
    for (size_t depth = 0; depth + 1 < levels_.size(); depth++) {
        const auto& level = levels_[depth];
        size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        out.push_back(sibling < level.size() ? level[sibling] : level[index]);
        index /= 2;
    }
    return out;
}

size_t MerkleTree::leafCount() const {
    return levels_.empty() ? 0 : levels_[0].size();
}

bool MerkleTree::empty() const {
    return levels_.empty();
}

bool MerkleEligibilityOracle::hasDuplicateUnits(const std::vector<uint64_t>& unitIds) {
    std::unordered_set<uint64_t> seen;
    seen.reserve(unitIds.size());
    for (uint64_t id : unitIds) {
        if (!seen.insert(id).second) return true;
    }
    return false;
}

bool MerkleEligibilityOracle::verify(const Hash256& root,
                                     const std::string& address,
                                     const std::vector<uint64_t>& unitIds,
                                     const std::vector<Hash256>& proof) const {
    if (isZero(root) || address.empty() || unitIds.empty()) return false;
    if (hasDuplicateUnits(unitIds)) return false;
    return verifyProof(root, ownershipLeaf(address, unitIds), proof);
}

}
}
