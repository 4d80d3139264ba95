#include "core/access_control.h"

namespace curator {
namespace core {

void AccessControl::grant(Role role, const Address& account) {
    roles_[role].insert(account);
}

bool AccessControl::revoke(Role role, const Address& account) {
    auto it = roles_.find(role);
    if (it == roles_.end()) return false;
    return it->second.erase(account) > 0;
}

bool AccessControl::hasRole(Role role, const Address& account) const {
    auto it = roles_.find(role);
    return it != roles_.end() && it->second.count(account) > 0;
}

std::vector<Address> AccessControl::members(Role role) const {
    auto it = roles_.find(role);
    if (it == roles_.end()) return {};
    return std::vector<Address>(it->second.begin(), it->second.end());
}

size_t AccessControl::memberCount(Role role) const {
    auto it = roles_.find(role);
    return it == roles_.end() ? 0 : it->second.size();
}

void AccessControl::setDelegate(const Address& elector, const Address& delegate, bool approved) {
    if (approved) {
        delegates_[elector].insert(delegate);
        return;
    }
    auto it = delegates_.find(elector);
    if (it == delegates_.end()) return;
    it->second.erase(delegate);
    if (it->second.empty()) delegates_.erase(it);
}

bool AccessControl::isDelegate(const Address& elector, const Address& delegate) const {
    auto it = delegates_.find(elector);
    return it != delegates_.end() && it->second.count(delegate) > 0;
}

bool AccessControl::canActFor(const Address& actor, const Address& elector) const {
    return actor == elector || isDelegate(elector, actor) || hasRole(Role::RELAYER, actor);
}

void AccessControl::pause(const std::string& reason) {
    paused_ = true;
    pauseReason_ = reason;
}

void AccessControl::unpause() {
    paused_ = false;
    pauseReason_.clear();
}

}
}
