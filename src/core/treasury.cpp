#include "core/treasury.h"

namespace curator {
namespace core {

std::optional<PaymentReceipt> Treasury::quote(uint64_t offered, uint64_t cost) {
    if (offered < cost) return std::nullopt;
    PaymentReceipt r;
    r.charged = cost;
    r.refunded = offered - cost;
    return r;
}

void Treasury::credit(const Address& treasury, uint64_t amount) {
    if (amount == 0) return;
    balances_[treasury] += amount;
    totalCollected_ += amount;
}

uint64_t Treasury::balance(const Address& treasury) const {
    auto it = balances_.find(treasury);
    return it == balances_.end() ? 0 : it->second;
}

}
}
