#pragma once

#include <stdexcept>
#include <string>

namespace lotledger::core {

class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed transaction or valuation request.
class ValidationError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/// A SELL asked for more than the open lots hold. Short selling is rejected.
class InsufficientLotsError : public LedgerError {
public:
    InsufficientLotsError(const std::string& symbol, double requested, double available)
        : LedgerError("Insufficient open lots for " + symbol + ": requested " +
                      std::to_string(requested) + ", available " + std::to_string(available)),
          requested_(requested),
          available_(available) {}

    double requested() const { return requested_; }
    double available() const { return available_; }

private:
    double requested_;
    double available_;
};

/// external_id already recorded for the account with a different payload.
class DuplicateTransactionError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/// Persistence failure. Propagated, never retried here.
class StorageError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

}  // namespace lotledger::core
