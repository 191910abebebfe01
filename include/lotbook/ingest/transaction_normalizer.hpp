#pragma once

#include <lotbook/core/raw_table.hpp>
#include <lotbook/core/transaction.hpp>
#include <lotbook/ingest/header_map.hpp>
#include <string>
#include <vector>

namespace lotbook::ingest {

struct SkippedRow {
    size_t row = 0;
    std::string rule;
    std::string message;
};

struct NormalizedLog {
    std::vector<core::TransactionEvent> events;  // source order
    std::vector<SkippedRow> skipped;
    size_t blank_rows = 0;
};

/**
 * Turns raw transaction rows into typed events.
 *
 * A missing required column throws MissingColumnError before any row is read.
 * A row that breaks a parsing or validation rule is recorded in
 * NormalizedLog::skipped and logged; the remaining rows are still processed.
 * Events keep source order, ordering by date is left to the ledger.
 */
class TransactionNormalizer {
public:
    NormalizedLog normalize(const core::RawTable& table) const;

    // Throws MalformedRowError
    static core::TransactionEvent normalize_row(const HeaderMap& columns,
                                                const std::vector<std::string>& row,
                                                size_t row_number);

    static const std::vector<Field>& required_fields();
};

} // namespace lotbook::ingest
