#include "access_control.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

std::string role_string(Role role) {
    switch (role) {
        case Role::Admin: return "admin";
        case Role::Manager: return "manager";
        default: return "unknown";
    }
}

Role parse_role(const std::string& text) {
    if (text == "admin") return Role::Admin;
    if (text == "manager") return Role::Manager;
    throw ValidationError("unknown role: " + text);
}

AccessControl::AccessControl(const Address& admin) {
    if (admin.empty()) {
        throw ValidationError("admin address is required");
    }
    members_[Role::Admin].insert(admin);
}

bool AccessControl::has_role(Role role, const Address& account) const {
    auto it = members_.find(role);
    return it != members_.end() && it->second.count(account) > 0;
}

void AccessControl::require_role(Role role, const Address& account) const {
    if (!has_role(role, account)) {
        throw AccessDenied(account + " lacks the " + role_string(role) + " role");
    }
}

bool AccessControl::grant_role(const Address& caller, Role role, const Address& account) {
    require_role(Role::Admin, caller);
    if (account.empty()) {
        throw ValidationError("cannot grant a role to an empty address");
    }
    bool inserted = members_[role].insert(account).second;
    if (inserted) {
        spdlog::info("Granted {} role to {}", role_string(role), account);
    }
    return inserted;
}

bool AccessControl::revoke_role(const Address& caller, Role role, const Address& account) {
    require_role(Role::Admin, caller);
    if (role == Role::Admin && account == caller && members_[Role::Admin].size() == 1) {
        throw InsufficientState("cannot revoke the last admin");
    }
    bool erased = members_[role].erase(account) > 0;
    if (erased) {
        spdlog::info("Revoked {} role from {}", role_string(role), account);
    }
    return erased;
}
