#include "core/ownership.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace curator {
namespace core {

using json = nlohmann::json;

void OwnershipRoots::rotate(const crypto::Hash256& root, Timestamp now) {
    previous = current;
    current = root;
    updatedAt = now;
    updateCount++;
}

bool OwnershipSnapshot::loadFile(const std::string& path, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return loadJson(ss.str(), error);
}

bool OwnershipSnapshot::loadJson(const std::string& text, std::string* error) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("holders") || !doc["holders"].is_array()) {
        if (error) *error = "snapshot must be an object with a holders array";
        return false;
    }

    holders_.clear();
    index_.clear();
    for (const auto& h : doc["holders"]) {
        if (!h.is_object() || !h.contains("address") || !h["address"].is_string()) {
            if (error) *error = "holder entry without address";
            return false;
        }
        const char* unitsKey = h.contains("tokenIds") ? "tokenIds" : "units";
        if (!h.contains(unitsKey) || !h[unitsKey].is_array()) {
            if (error) *error = "holder entry without unit ids";
            return false;
        }
        Address addr = normalizeAddress(h["address"].get<std::string>());
        if (addr.empty()) {
            if (error) *error = "invalid holder address";
            return false;
        }
        std::vector<uint64_t> units;
        for (const auto& u : h[unitsKey]) {
            if (!u.is_number_unsigned()) {
                if (error) *error = "unit ids must be unsigned integers";
                return false;
            }
            units.push_back(u.get<uint64_t>());
        }
        if (units.empty()) continue;
        addHolder(addr, std::move(units));
    }
    build();
    return true;
}

void OwnershipSnapshot::addHolder(const Address& address, std::vector<uint64_t> unitIds) {
    auto it = index_.find(address);
    if (it != index_.end()) {
        auto& units = holders_[it->second].unitIds;
        units.insert(units.end(), unitIds.begin(), unitIds.end());
        return;
    }
    index_[address] = holders_.size();
    holders_.push_back({address, std::move(unitIds)});
}

const Holder* OwnershipSnapshot::find(const Address& address) const {
    auto it = index_.find(address);
    return it == index_.end() ? nullptr : &holders_[it->second];
}

uint64_t OwnershipSnapshot::totalUnits() const {
    uint64_t n = 0;
    for (const auto& h : holders_) n += h.unitIds.size();
    return n;
}

void OwnershipSnapshot::build() {
    std::vector<crypto::Hash256> leaves;
    leaves.reserve(holders_.size());
    for (const auto& h : holders_) {
        leaves.push_back(crypto::ownershipLeaf(h.address, h.unitIds));
    }
    tree_ = crypto::MerkleTree(std::move(leaves));
}

std::vector<crypto::Hash256> OwnershipSnapshot::proofFor(const Address& address) const {
    auto it = index_.find(address);
    if (it == index_.end()) return {};
    return tree_.proof(it->second);
}

std::string OwnershipSnapshot::merkleJson() const {
    json out;
    out["root"] = "0x" + crypto::toHex(root());
    out["totalLeaves"] = holders_.size();
    out["totalUnits"] = totalUnits();
    json proofs = json::object();
    for (size_t i = 0; i < holders_.size(); i++) {
        json p = json::array();
        for (const auto& h : tree_.proof(i)) p.push_back("0x" + crypto::toHex(h));
        proofs[holders_[i].address] = p;
    }
    out["proofs"] = proofs;
    return out.dump(2);
}

}
}
