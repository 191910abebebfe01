#pragma once
#include <lotbook/ledger/distribution_allocator.hpp>
#include <lotbook/ledger/tranche_book.hpp>
#include <string>
#include <vector>

namespace lotbook::ledger {

// Whole-run distribution totals for one symbol
struct SymbolSummaryRow {
    std::string symbol;
    double distribution = 0.0;
    double taxable = 0.0;
    double roc = 0.0;
    double roc_ratio = 0.0;
    size_t dividend_count = 0;
    size_t allocation_count = 0;
    size_t unallocated_count = 0;
    double unallocated_distribution = 0.0;
    size_t lot_count = 0;
    size_t open_lot_count = 0;
    double shares_remaining = 0.0;
    bool ledger_failed = false;
};

// One row per symbol seen in the book, the allocations or the unallocated list
std::vector<SymbolSummaryRow> summarize_symbols(const AllocationResult& allocations,
                                                const TrancheBook& book,
                                                const ReplayReport& replay);

} // namespace lotbook::ledger
