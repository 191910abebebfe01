#pragma once
#include <lotbook/core/date.hpp>
#include <lotbook/core/transaction.hpp>
#include <lotbook/ledger/tranche.hpp>
#include <lotbook/ledger/tranche_book.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lotbook::ledger {

// A source transaction with the ledger's derived columns attached
struct AnnotatedTransaction {
    size_t row = 0;
    core::EventKind kind = core::EventKind::BUY;
    core::Date date;
    core::Date week_start;
    std::string symbol;
    std::string lot_id;
    double shares = 0.0;
    double price = 0.0;
    double cost = 0.0;
    double running_shares = 0.0;

    // Dividend rows, per share of running_shares
    std::optional<double> distribution;
    std::optional<double> taxable;
    std::optional<double> roc;
    std::optional<double> dist_per_share;
    std::optional<double> income_per_share;
    std::optional<double> roc_per_share;

    // Buy/Sell rows, lot state as of the row date
    std::optional<double> lot_remaining;
    std::optional<TrancheStatus> lot_status;
};

// Returns one annotation per event, in the events' order. Running share
// counts accumulate per symbol in (date, row) order.
std::vector<AnnotatedTransaction> annotate_transactions(const std::vector<core::TransactionEvent>& events,
                                                        const TrancheBook& book,
                                                        core::Weekday week_anchor = core::Weekday::MONDAY);

} // namespace lotbook::ledger
