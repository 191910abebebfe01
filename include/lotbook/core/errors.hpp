#pragma once
#include <lotbook/core/date.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace lotbook::core {

class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}
};

// A required column could not be found in the header row. Aborts the run.
class MissingColumnError : public LedgerError {
public:
    MissingColumnError(const std::string& field, const std::string& found_headers);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// One row failed a parsing or validation rule. The row is skipped.
class MalformedRowError : public LedgerError {
public:
    MalformedRowError(size_t row, const std::string& rule, const std::string& detail);

    size_t row() const { return row_; }
    const std::string& rule() const { return rule_; }

private:
    size_t row_;
    std::string rule_;
};

// Base for errors that invalidate a single symbol's ledger
class LotResolutionError : public LedgerError {
public:
    LotResolutionError(const std::string& message, size_t row, const Date& date,
                       const std::string& symbol, const std::string& lot_id);

    size_t row() const { return row_; }
    const Date& date() const { return date_; }
    const std::string& symbol() const { return symbol_; }
    const std::string& lot_id() const { return lot_id_; }

private:
    size_t row_;
    Date date_;
    std::string symbol_;
    std::string lot_id_;
};

class UnknownLotError : public LotResolutionError {
public:
    UnknownLotError(size_t row, const Date& date, const std::string& symbol,
                    const std::string& lot_id, const std::string& reason);
};

class AmbiguousLotError : public LotResolutionError {
public:
    AmbiguousLotError(size_t row, const Date& date, const std::string& symbol,
                      size_t open_lots);
};

// A Buy tried to add shares to a lot that has already been sold out
class ClosedLotError : public LotResolutionError {
public:
    ClosedLotError(size_t row, const Date& date, const std::string& symbol,
                   const std::string& lot_id);
};

class OverSellError : public LotResolutionError {
public:
    OverSellError(size_t row, const Date& date, const std::string& symbol,
                  const std::string& lot_id, double requested, double available);
};

} // namespace lotbook::core
