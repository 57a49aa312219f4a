// Pasifika - Operation Status
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Status returned by every state-changing ledger operation. A non-OK status
// means the operation was rejected and no state change was persisted.

#ifndef PASIFIKA_CORE_STATUS_H
#define PASIFIKA_CORE_STATUS_H

#include <ostream>
#include <string>

namespace pasifika {

// ============================================================================
// Status - Result of ledger operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        INVALID_ARGUMENT = 1,
        FAILED_PRECONDITION = 2,
        UNAUTHORIZED = 3,
        INSUFFICIENT_FUNDS = 4,
        NOT_FOUND = 5,
        ALREADY_EXISTS = 6,
        TRANSFER_FAILED = 7,
        REENTRANCY = 8,
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status FailedPrecondition(const std::string& msg = "") { return Status(FAILED_PRECONDITION, msg); }
    static Status Unauthorized(const std::string& msg = "") { return Status(UNAUTHORIZED, msg); }
    static Status InsufficientFunds(const std::string& msg = "") { return Status(INSUFFICIENT_FUNDS, msg); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status AlreadyExists(const std::string& msg = "") { return Status(ALREADY_EXISTS, msg); }
    static Status TransferFailed(const std::string& msg = "") { return Status(TRANSFER_FAILED, msg); }
    static Status Reentrancy(const std::string& msg = "reentrant call") { return Status(REENTRANCY, msg); }

    bool ok() const { return code_ == OK; }
    bool IsInvalidArgument() const { return code_ == INVALID_ARGUMENT; }
    bool IsFailedPrecondition() const { return code_ == FAILED_PRECONDITION; }
    bool IsUnauthorized() const { return code_ == UNAUTHORIZED; }
    bool IsInsufficientFunds() const { return code_ == INSUFFICIENT_FUNDS; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsAlreadyExists() const { return code_ == ALREADY_EXISTS; }
    bool IsTransferFailed() const { return code_ == TRANSFER_FAILED; }
    bool IsReentrancy() const { return code_ == REENTRANCY; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result;
        switch (code_) {
            case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
            case FAILED_PRECONDITION: result = "FailedPrecondition: "; break;
            case UNAUTHORIZED: result = "Unauthorized: "; break;
            case INSUFFICIENT_FUNDS: result = "InsufficientFunds: "; break;
            case NOT_FOUND: result = "NotFound: "; break;
            case ALREADY_EXISTS: result = "AlreadyExists: "; break;
            case TRANSFER_FAILED: result = "TransferFailed: "; break;
            case REENTRANCY: result = "Reentrancy: "; break;
            default: result = "Unknown: "; break;
        }
        return result + message_;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Status& status) {
    return os << status.ToString();
}

} // namespace pasifika

#endif // PASIFIKA_CORE_STATUS_H
