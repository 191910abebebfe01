#include <lotbook/core/errors.hpp>
#include <sstream>

namespace lotbook::core {

namespace {

std::string row_context(size_t row, const Date& date) {
    std::ostringstream oss;
    oss << "row " << row << " (" << date.to_string() << ")";
    return oss.str();
}

} // namespace

MissingColumnError::MissingColumnError(const std::string& field, const std::string& found_headers)
    : LedgerError("Missing required column \"" + field + "\". Found: [" + found_headers + "]"),
      field_(field) {}

MalformedRowError::MalformedRowError(size_t row, const std::string& rule, const std::string& detail)
    : LedgerError("Row " + std::to_string(row) + " rejected by rule '" + rule + "': " + detail),
      row_(row),
      rule_(rule) {}

LotResolutionError::LotResolutionError(const std::string& message, size_t row, const Date& date,
                                       const std::string& symbol, const std::string& lot_id)
    : LedgerError(message),
      row_(row),
      date_(date),
      symbol_(symbol),
      lot_id_(lot_id) {}

UnknownLotError::UnknownLotError(size_t row, const Date& date, const std::string& symbol,
                                 const std::string& lot_id, const std::string& reason)
    : LotResolutionError("Trade at " + row_context(row, date) + " for " + symbol +
                             " cannot be attributed to lot '" + lot_id + "': " + reason,
                         row, date, symbol, lot_id) {}

AmbiguousLotError::AmbiguousLotError(size_t row, const Date& date, const std::string& symbol,
                                     size_t open_lots)
    : LotResolutionError("Sell at " + row_context(row, date) + " for " + symbol +
                             " carries no lot id while " + std::to_string(open_lots) +
                             " lots hold shares",
                         row, date, symbol, "") {}

ClosedLotError::ClosedLotError(size_t row, const Date& date, const std::string& symbol,
                               const std::string& lot_id)
    : LotResolutionError("Buy at " + row_context(row, date) + " for " + symbol +
                             " cannot add shares to closed lot '" + lot_id + "'",
                         row, date, symbol, lot_id) {}

OverSellError::OverSellError(size_t row, const Date& date, const std::string& symbol,
                             const std::string& lot_id, double requested, double available)
    : LotResolutionError([&] {
                             std::ostringstream oss;
                             oss << "Sell at " << row_context(row, date) << " of " << requested
                                 << " shares exceeds the " << available
                                 << " remaining in lot '" << lot_id << "'";
                             return oss.str();
                         }(),
                         row, date, symbol, lot_id) {}

} // namespace lotbook::core
