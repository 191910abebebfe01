#include <lotbook/ledger/symbol_summary.hpp>
#include <map>
#include <set>

namespace lotbook::ledger {

std::vector<SymbolSummaryRow> summarize_symbols(const AllocationResult& allocations,
                                                const TrancheBook& book,
                                                const ReplayReport& replay) {
    std::map<std::string, SymbolSummaryRow> rows;
    std::map<std::string, std::set<size_t>> dividends;

    auto row_for = [&rows](const std::string& symbol) -> SymbolSummaryRow& {
        SymbolSummaryRow& row = rows[symbol];
        row.symbol = symbol;
        return row;
    };

    for (const Tranche* lot : book.lots()) {
        SymbolSummaryRow& row = row_for(lot->symbol());
        ++row.lot_count;
        if (lot->status() != TrancheStatus::CLOSED) {
            ++row.open_lot_count;
        }
        row.shares_remaining += lot->shares_remaining();
    }

    for (const auto& allocation : allocations.rows) {
        SymbolSummaryRow& row = row_for(allocation.symbol);
        row.distribution += allocation.distribution_amount;
        row.taxable += allocation.income_amount;
        row.roc += allocation.roc_amount;
        ++row.allocation_count;
        dividends[allocation.symbol].insert(allocation.dividend_row);
    }

    for (const auto& missed : allocations.unallocated) {
        SymbolSummaryRow& row = row_for(missed.symbol);
        ++row.unallocated_count;
        row.unallocated_distribution += missed.distribution;
    }

    for (const auto& failure : replay.failures) {
        row_for(failure.symbol).ledger_failed = true;
    }

    std::vector<SymbolSummaryRow> out;
    out.reserve(rows.size());
    for (auto& [symbol, row] : rows) {
        row.dividend_count = dividends[symbol].size();
        row.roc_ratio = row.distribution > 0.0 ? row.roc / row.distribution : 0.0;
        out.push_back(row);
    }
    return out;
}

} // namespace lotbook::ledger
