#pragma once
#include <lotbook/core/date.hpp>
#include <lotbook/core/transaction.hpp>
#include <lotbook/ledger/tranche.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace lotbook::ledger {

struct BookSettings {
    // Reject a Sell without lot id while the symbol has several lots holding shares
    bool strict_sell_resolution = false;
};

struct SymbolFailure {
    std::string symbol;
    size_t row = 0;
    core::Date date;
    std::string lot_id;
    std::string message;
};

struct ReplayReport {
    size_t buys = 0;
    size_t sells = 0;
    std::vector<SymbolFailure> failures;
};

struct LotHolding {
    Tranche* lot;
    double remaining;
};

// Lot letters for a (symbol, date) pair: 0 -> "A", 25 -> "Z", 26 -> "AA"
std::string sequence_letter(size_t index);

/**
 * Builds tax lots from buy and sell events.
 *
 * Each symbol is replayed on its own in (date, source row) order. A Buy
 * creates or extends the lot named by its override, or a fresh lot with id
 * SYMBOL_YYMMDD_<letter>. A Sell applies to its override lot, else to the
 * lot most recently established for the symbol.
 */
class TrancheBook {
public:
    explicit TrancheBook(BookSettings settings = {});

    // Clears the book, then replays every Buy/Sell. A lot resolution error
    // drops that symbol's lots and is recorded in the report.
    ReplayReport replay(const std::vector<core::TransactionEvent>& events);

    // Applies a single Buy/Sell and returns the lot id it touched. Throws
    // UnknownLotError, AmbiguousLotError, ClosedLotError or OverSellError
    // without changing state.
    const std::string& apply(const core::TransactionEvent& event);

    void clear();

    const Tranche* find(const std::string& lot_id) const;
    std::vector<const Tranche*> lots() const;
    std::vector<const Tranche*> lots_for_symbol(const std::string& symbol) const;

    // Lots of symbol with shares remaining on date, counting only buys and sells dated <= date
    std::vector<LotHolding> holdings_as_of(const std::string& symbol, const core::Date& date);

    // Lot id resolved for a Buy/Sell source row, empty if the row was not applied
    std::string lot_for_row(size_t row) const;

    bool symbol_failed(const std::string& symbol) const;
    size_t size() const { return lots_.size(); }

private:
    const std::string& apply_buy(const core::TransactionEvent& event);
    const std::string& apply_sell(const core::TransactionEvent& event);
    std::string derive_lot_id(const std::string& symbol, const core::Date& date);
    void drop_symbol(const std::string& symbol);

    BookSettings settings_;
    std::map<std::string, Tranche> lots_;
    std::map<std::string, std::vector<std::string>> lots_by_symbol_;
    std::map<std::pair<std::string, std::string>, size_t> sequence_;
    std::map<std::string, std::string> latest_lot_;
    std::map<size_t, std::string> lot_for_row_;
    std::map<std::string, SymbolFailure> failed_symbols_;
};

} // namespace lotbook::ledger
