#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Validation,
    Invariant,
    InsufficientState,
    ExternalFailure,
    AccessDenied,
    Reentrancy,
    Paused
};

std::string error_kind_string(ErrorKind kind);

class VaultError : public std::runtime_error {
public:
    VaultError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    
    ErrorKind kind() const { return kind_; }
    
private:
    ErrorKind kind_;
};

// Bad index, empty address, zero amount.
class ValidationError : public VaultError {
public:
    explicit ValidationError(const std::string& message)
        : VaultError(ErrorKind::Validation, message) {}
};

// Allocation cap or aggregate cap exceeded.
class InvariantViolation : public VaultError {
public:
    explicit InvariantViolation(const std::string& message)
        : VaultError(ErrorKind::Invariant, message) {}
};

class InsufficientState : public VaultError {
public:
    explicit InsufficientState(const std::string& message)
        : VaultError(ErrorKind::InsufficientState, message) {}
};

// A sub-account or asset call failed or reported something inconsistent.
class ExternalFailure : public VaultError {
public:
    explicit ExternalFailure(const std::string& message)
        : VaultError(ErrorKind::ExternalFailure, message) {}
};

class AccessDenied : public VaultError {
public:
    explicit AccessDenied(const std::string& message)
        : VaultError(ErrorKind::AccessDenied, message) {}
};

class ReentrancyError : public VaultError {
public:
    explicit ReentrancyError(const std::string& message)
        : VaultError(ErrorKind::Reentrancy, message) {}
};

class PausedError : public VaultError {
public:
    explicit PausedError(const std::string& message)
        : VaultError(ErrorKind::Paused, message) {}
};
