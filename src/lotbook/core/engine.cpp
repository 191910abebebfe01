#include <lotbook/core/engine.hpp>
#include <lotbook/utils/logger.hpp>
#include <stdexcept>

namespace lotbook::core {

EngineConfiguration EngineConfiguration::from_config(const utils::Config& config) {
    EngineConfiguration settings;

    const std::string anchor = config.get("week_anchor", "monday");
    auto weekday = parse_weekday(anchor);
    if (!weekday) {
        throw std::invalid_argument("Unknown week_anchor '" + anchor + "'");
    }
    settings.week_anchor = *weekday;
    settings.strict_sell_resolution = config.get_bool("ledger.strict_sell_resolution", false);
    settings.exit_ready_threshold = config.get("gains.exit_ready_threshold", 1.0);
    settings.log_level = config.get("log_level", "info");
    return settings;
}

Engine::Engine() {
    EngineConfiguration default_config;
    config_ = default_config;
}

void Engine::configure(const EngineConfiguration& config) {
    config_ = config;
}

RunResult Engine::run(const RawTable& transactions, const PriceLookup& prices, const Date& as_of) const {
    RunResult result;
    result.as_of = as_of;
    result.source_rows = transactions.rows.size();

    utils::Logger::info() << "Run started: " << transactions.rows.size() << " source rows, as of "
                          << as_of.to_string() << utils::Logger::endl;

    ingest::TransactionNormalizer normalizer;
    ingest::NormalizedLog log = normalizer.normalize(transactions);
    result.events = log.events.size();
    result.skipped = log.skipped;

    ledger::TrancheBook book(ledger::BookSettings{config_.strict_sell_resolution});
    result.replay = book.replay(log.events);

    ledger::DistributionAllocator allocator(config_.week_anchor);
    result.allocations = allocator.allocate(log.events, book);

    ledger::GainCalculator gains(prices, as_of, ledger::GainSettings{config_.exit_ready_threshold});
    result.tranches = gains.evaluate_all(book);

    ledger::IncomeAggregator aggregator;
    aggregator.add_all(result.allocations.rows);
    result.income = aggregator.build();

    result.symbols = ledger::summarize_symbols(result.allocations, book, result.replay);
    result.transactions = ledger::annotate_transactions(log.events, book, config_.week_anchor);

    utils::Logger::info() << "Run finished: " << result.tranches.size() << " lots, "
                          << result.allocations.rows.size() << " allocations, "
                          << result.income.size() << " income rows, "
                          << result.skipped.size() << " skipped rows, "
                          << result.replay.failures.size() << " failed symbols"
                          << utils::Logger::endl;
    return result;
}

} // namespace lotbook::core
