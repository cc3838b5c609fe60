#pragma once

#include "types.hpp"
#include <map>
#include <set>
#include <string>

enum class Role {
    Admin,
    Manager
};

std::string role_string(Role role);
Role parse_role(const std::string& text);

class AccessControl {
public:
    explicit AccessControl(const Address& admin);
    
    bool has_role(Role role, const Address& account) const;
    // Throws AccessDenied.
    void require_role(Role role, const Address& account) const;
    
    // Both require the caller to be an admin. Return false when nothing changed.
    bool grant_role(const Address& caller, Role role, const Address& account);
    bool revoke_role(const Address& caller, Role role, const Address& account);
    
private:
    std::map<Role, std::set<Address>> members_;
};
