#include "crypto/crypto.h"
#include "crypto/merkle.h"
#include "core/ownership.h"
#include <nlohmann/json.hpp>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace curator;
using crypto::Hash256;

static void testSha256KnownVectors() {
    assert(crypto::toHex(crypto::sha256(std::string(""))) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(crypto::toHex(crypto::sha256(std::string("abc"))) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    crypto::Sha256 h;
    h.update(std::string("a")).update(std::string("bc"));
    assert(h.finalize() == crypto::sha256(std::string("abc")));
}

static void testHexParsing() {
    std::vector<uint8_t> out;
    assert(crypto::fromHex("0x00ff10", out));
    assert(out.size() == 3 && out[1] == 0xff);
    assert(!crypto::fromHex("abc", out));
    assert(!crypto::fromHex("zz", out));

    Hash256 h{};
    std::string hex(64, 'a');
    assert(crypto::parseHash256(hex, h));
    assert(h[0] == 0xaa);
    assert(!crypto::parseHash256("0x1234", h));
}

static void testHashPairIsOrderIndependent() {
    Hash256 a = crypto::sha256(std::string("a"));
    Hash256 b = crypto::sha256(std::string("b"));
    assert(crypto::hashPair(a, b) == crypto::hashPair(b, a));
    assert(crypto::hashPair(a, b) != a);
}

static void testTreeProofs() {
    std::vector<Hash256> leaves;
    for (uint64_t i = 0; i < 5; i++) {
        leaves.push_back(crypto::ownershipLeaf("holder" + std::to_string(i), {i + 1}));
    }
    crypto::MerkleTree tree(leaves);
    assert(tree.leafCount() == 5);
    assert(!crypto::isZero(tree.root()));

    for (size_t i = 0; i < leaves.size(); i++) {
        auto proof = tree.proof(i);
        assert(proof.size() == 3);
        assert(crypto::verifyProof(tree.root(), leaves[i], proof));
    }
    assert(!crypto::verifyProof(tree.root(), leaves[0], tree.proof(1)));
    assert(tree.proof(9).empty());

    crypto::MerkleTree single(std::vector<Hash256>{leaves[0]});
    assert(single.root() == leaves[0]);
    assert(single.proof(0).empty());

    crypto::MerkleTree none;
    assert(none.empty());
    assert(crypto::isZero(none.root()));
}

static void testOracle() {
    crypto::MerkleEligibilityOracle oracle;
    std::vector<Hash256> leaves = {
        crypto::ownershipLeaf("alice", {1, 2}),
        crypto::ownershipLeaf("bob", {3}),
        crypto::ownershipLeaf("carol", {4, 5, 6})
    };
    crypto::MerkleTree tree(leaves);
    Hash256 root = tree.root();

    assert(oracle.verify(root, "alice", {1, 2}, tree.proof(0)));
    assert(oracle.verify(root, "carol", {4, 5, 6}, tree.proof(2)));

    // Claims that differ from the snapshot leaf in any way are rejected.
    assert(!oracle.verify(root, "alice", {1}, tree.proof(0)));
    assert(!oracle.verify(root, "alice", {2, 1}, tree.proof(0)));
    assert(!oracle.verify(root, "bob", {1, 2}, tree.proof(0)));
    assert(!oracle.verify(root, "alice", {1, 1}, tree.proof(0)));
    assert(!oracle.verify(root, "alice", {}, tree.proof(0)));
    assert(!oracle.verify(Hash256{}, "alice", {1, 2}, tree.proof(0)));

    assert(crypto::MerkleEligibilityOracle::hasDuplicateUnits({5, 6, 5}));
    assert(!crypto::MerkleEligibilityOracle::hasDuplicateUnits({5, 6, 7}));
}

static void testSnapshotJson() {
    core::OwnershipSnapshot snapshot;
    std::string err;
    bool ok = snapshot.loadJson(R"({"holders":[
        {"address":"Alice","tokenIds":[1,2]},
        {"address":"bob","units":[3]},
        {"address":"alice","tokenIds":[9]},
        {"address":"dave","tokenIds":[]}
    ]})", &err);
    assert(ok);
    assert(snapshot.holders().size() == 2);
    const core::Holder* alice = snapshot.find("alice");
    assert(alice != nullptr);
    assert(alice->unitIds.size() == 3);
    assert(snapshot.find("dave") == nullptr);
    assert(snapshot.totalUnits() == 4);

    crypto::MerkleEligibilityOracle oracle;
    assert(oracle.verify(snapshot.root(), "alice", alice->unitIds, snapshot.proofFor("alice")));
    assert(oracle.verify(snapshot.root(), "bob", {3}, snapshot.proofFor("bob")));

    nlohmann::json doc = nlohmann::json::parse(snapshot.merkleJson());
    assert(doc["root"].get<std::string>() == "0x" + crypto::toHex(snapshot.root()));
    assert(doc["totalLeaves"].get<size_t>() == 2);
    assert(doc["totalUnits"].get<uint64_t>() == 4);
    assert(doc["proofs"].contains("bob"));

    core::OwnershipSnapshot bad;
    assert(!bad.loadJson(R"({"holders":[{"address":"x","tokenIds":[-1]}]})", &err));
    assert(!err.empty());
    assert(!bad.loadJson("[]", &err));
    assert(!bad.loadJson("not json", &err));
}

static void testRootRotation() {
    core::OwnershipRoots roots;
    assert(!roots.hasCurrent());
    Hash256 r1 = crypto::sha256(std::string("r1"));
    Hash256 r2 = crypto::sha256(std::string("r2"));
    roots.rotate(r1, 10);
    roots.rotate(r2, 20);
    assert(roots.current == r2);
    assert(roots.previous == r1);
    assert(roots.updatedAt == 20);
    assert(roots.updateCount == 2);
}

int main() {
    testSha256KnownVectors();
    testHexParsing();
    testHashPairIsOrderIndependent();
    testTreeProofs();
    testOracle();
    testSnapshotJson();
    testRootRotation();
    std::cout << "Merkle tests passed" << std::endl;
    return 0;
}
