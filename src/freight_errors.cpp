#include "freight_errors.hpp"
#include <format>

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ToolExecution: return "ToolExecutionError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::SecretConflict: return "SecretConflictError";
        case ErrorKind::InvalidState: return "InvalidStateError";
        case ErrorKind::Transfer: return "TransferError";
        case ErrorKind::Ledger: return "LedgerError";
    }
    return "UnknownError";
}

std::string Failure::describe() const {
    return std::format("{}: {}: {}", stage, errorKindName(kind), message);
}
