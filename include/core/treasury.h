#pragma once

#include "core/types.h"
#include <optional>
#include <unordered_map>

namespace curator {
namespace core {

struct PaymentReceipt {
    uint64_t charged = 0;
    uint64_t refunded = 0;
};

class Treasury {
public:
    // nullopt when the offer does not cover the cost.
    static std::optional<PaymentReceipt> quote(uint64_t offered, uint64_t cost);

    void credit(const Address& treasury, uint64_t amount);
    uint64_t balance(const Address& treasury) const;
    uint64_t totalCollected() const { return totalCollected_; }
    uint64_t totalRefunded() const { return totalRefunded_; }
    void recordRefund(uint64_t amount) { totalRefunded_ += amount; }

private:
    std::unordered_map<Address, uint64_t> balances_;
    uint64_t totalCollected_ = 0;
    uint64_t totalRefunded_ = 0;
};

}
}
