#include "core/eligible_set.h"
#include <algorithm>

namespace curator {
namespace core {

bool EligibleSet::insert(SeedId id) {
    if (id == NO_SEED || index_.count(id)) return false;
    index_[id] = ids_.size();
    ids_.push_back(id);
    return true;
}

bool EligibleSet::remove(SeedId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    size_t pos = it->second;
    SeedId last = ids_.back();
    ids_[pos] = last;
    index_[last] = pos;
    ids_.pop_back();
    index_.erase(id);
    return true;
}

bool EligibleSet::contains(SeedId id) const {
    return index_.find(id) != index_.end();
}

void EligibleSet::clear() {
    ids_.clear();
    index_.clear();
}

std::vector<SeedId> EligibleSet::page(size_t offset, size_t limit) const {
    if (offset >= ids_.size() || limit == 0) return {};
    size_t end = offset + std::min(limit, ids_.size() - offset);
    return std::vector<SeedId>(ids_.begin() + offset, ids_.begin() + end);
}

std::vector<SeedId> EligibleSet::sorted() const {
    std::vector<SeedId> out = ids_;
    std::sort(out.begin(), out.end());
    return out;
}

}
}
