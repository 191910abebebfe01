#pragma once
#include <lotbook/core/date.hpp>
#include <lotbook/core/transaction.hpp>
#include <lotbook/ledger/tranche.hpp>
#include <lotbook/ledger/tranche_book.hpp>
#include <string>
#include <vector>

namespace lotbook::ledger {

// One dividend event's slice credited to one lot
struct AllocationRow {
    size_t dividend_row = 0;
    core::Date week_start;
    core::Date distribution_date;
    std::string lot_id;
    std::string symbol;
    double cost_basis = 0.0;
    double shares_bought = 0.0;
    double remaining_at_date = 0.0;
    TrancheStatus status_at_date = TrancheStatus::OPEN;
    double dist_per_share = 0.0;
    double income_per_share = 0.0;
    double roc_per_share = 0.0;
    double distribution_amount = 0.0;
    double income_amount = 0.0;
    double roc_amount = 0.0;
    double roc_percent = 0.0;
};

// A dividend that could not be credited to any lot
struct UnallocatedDividend {
    size_t row = 0;
    core::Date date;
    std::string symbol;
    double distribution = 0.0;
    double taxable = 0.0;
    double roc = 0.0;
    std::string reason;
};

struct AllocationResult {
    std::vector<AllocationRow> rows;  // ordered by week, date, lot id
    std::vector<UnallocatedDividend> unallocated;
    size_t dividends = 0;
};

// Resolved totals of one dividend against a set of eligible shares
struct DividendSplit {
    double distribution = 0.0;
    double roc = 0.0;
    double taxable = 0.0;
};

/**
 * Splits each dividend pro rata over the lots of its symbol that hold shares
 * on the distribution date.
 *
 * Eligibility and weights use only buys and sells dated on or before the
 * distribution date. ROC comes from the explicit amount, else percent times
 * the distribution. Taxable income is the explicit figure when the source
 * supplies one, else distribution minus ROC.
 *
 * Allocation is additive: each dividend must be passed exactly once per run.
 */
class DistributionAllocator {
public:
    explicit DistributionAllocator(core::Weekday week_anchor = core::Weekday::MONDAY);

    AllocationResult allocate(const std::vector<core::TransactionEvent>& events,
                              TrancheBook& book) const;

    static DividendSplit resolve(const core::TransactionEvent& dividend, double eligible_shares);

private:
    void allocate_one(const core::TransactionEvent& dividend, TrancheBook& book,
                      AllocationResult& result) const;

    core::Weekday week_anchor_;
};

} // namespace lotbook::ledger
