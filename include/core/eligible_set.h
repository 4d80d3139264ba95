#pragma once

#include "core/types.h"
#include <unordered_map>
#include <vector>

namespace curator {
namespace core {

// Dense id array plus position index. Removal swaps the last id into the
// vacated slot, so iteration order depends on removal history.
class EligibleSet {
public:
    bool insert(SeedId id);
    bool remove(SeedId id);
    bool contains(SeedId id) const;
    void clear();

    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

    const std::vector<SeedId>& ids() const { return ids_; }
    std::vector<SeedId> page(size_t offset, size_t limit) const;
    std::vector<SeedId> sorted() const;

private:
    std::vector<SeedId> ids_;
    std::unordered_map<SeedId, size_t> index_;
};

}
}
