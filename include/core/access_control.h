#pragma once

#include "core/types.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace curator {
namespace core {

class AccessControl {
public:
    void grant(Role role, const Address& account);
    bool revoke(Role role, const Address& account);
    bool hasRole(Role role, const Address& account) const;
    std::vector<Address> members(Role role) const;
    size_t memberCount(Role role) const;

    void setDelegate(const Address& elector, const Address& delegate, bool approved);
    bool isDelegate(const Address& elector, const Address& delegate) const;

    // The elector itself, an approved delegate, or any relayer.
    bool canActFor(const Address& actor, const Address& elector) const;

    void pause(const std::string& reason);
    void unpause();
    bool isPaused() const { return paused_; }
    const std::string& pauseReason() const { return pauseReason_; }

private:
    std::map<Role, std::set<Address>> roles_;
    std::map<Address, std::set<Address>> delegates_;
    bool paused_ = false;
    std::string pauseReason_;
};

}
}
