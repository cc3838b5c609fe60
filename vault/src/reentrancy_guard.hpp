#pragma once

#include "errors.hpp"

// Single flag shared by every balance-affecting entry point. A nested
// entry on the same call path is rejected instead of deadlocking.
class ReentrancyGuard {
public:
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard) : guard_(guard) {
            if (guard_.entered_) {
                throw ReentrancyError("reentrant call rejected");
            }
            guard_.entered_ = true;
        }
        ~Scope() { guard_.entered_ = false; }
        
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        
    private:
        ReentrancyGuard& guard_;
    };
    
    bool entered() const { return entered_; }
    
private:
    bool entered_ = false;
};
