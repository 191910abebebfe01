// include/lotbook/core/engine.hpp
#pragma once
#include <string>
#include <vector>
#include "lotbook/core/date.hpp"
#include "lotbook/core/price_table.hpp"
#include "lotbook/core/raw_table.hpp"
#include "lotbook/ingest/transaction_normalizer.hpp"
#include "lotbook/ledger/distribution_allocator.hpp"
#include "lotbook/ledger/gain_calculator.hpp"
#include "lotbook/ledger/income_aggregator.hpp"
#include "lotbook/ledger/symbol_summary.hpp"
#include "lotbook/ledger/tranche_book.hpp"
#include "lotbook/ledger/transaction_annotator.hpp"
#include "lotbook/utils/config.hpp"

namespace lotbook {
namespace core {

// Engine configuration structure
struct EngineConfiguration {
    Weekday week_anchor = Weekday::MONDAY;
    bool strict_sell_resolution = false;
    double exit_ready_threshold = 1.0;

    // Logging
    std::string log_level = "info";

    // Throws std::invalid_argument for an unknown week_anchor
    static EngineConfiguration from_config(const utils::Config& config);
};

struct RunResult {
    Date as_of;
    size_t source_rows = 0;
    size_t events = 0;

    std::vector<ingest::SkippedRow> skipped;
    ledger::ReplayReport replay;
    ledger::AllocationResult allocations;
    std::vector<ledger::TrancheSnapshot> tranches;
    std::vector<ledger::IncomeRow> income;
    std::vector<ledger::SymbolSummaryRow> symbols;
    std::vector<ledger::AnnotatedTransaction> transactions;
};

/**
 * Runs the full batch: normalize, replay lots, allocate dividends, value
 * lots, aggregate income. Each run starts from an empty ledger, so the same
 * inputs and as-of date always give the same result.
 *
 * MissingColumnError propagates and no result is produced.
 */
class Engine {
private:
    EngineConfiguration config_;

public:
    Engine();

    // Configuration
    void configure(const EngineConfiguration& config);
    const EngineConfiguration& config() const { return config_; }

    RunResult run(const RawTable& transactions, const PriceLookup& prices, const Date& as_of) const;
};

} // namespace core
} // namespace lotbook
