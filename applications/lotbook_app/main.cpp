// applications/lotbook_app/main.cpp
#include "lotbook/core/engine.hpp"
#include "lotbook/core/price_table.hpp"
#include "lotbook/ingest/csv_reader.hpp"
#include "lotbook/report/csv_report_writer.hpp"
#include "lotbook/utils/config.hpp"
#include "lotbook/utils/logger.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    try {
        // Load configuration
        std::string config_file = argc > 1 ? argv[1] : "lotbook.conf";
        auto config = lotbook::utils::Config::instance();
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        auto settings = lotbook::core::EngineConfiguration::from_config(*config);
        lotbook::utils::Logger::set_level(lotbook::utils::Logger::parse_level(settings.log_level));

        lotbook::core::Date as_of = lotbook::core::Date::today();
        if (config->contains("report.as_of_date")) {
            std::string text = config->get("report.as_of_date", "");
            auto parsed = lotbook::core::Date::parse(text);
            if (!parsed) {
                std::cerr << "Invalid report.as_of_date '" << text << "'" << std::endl;
                return 1;
            }
            as_of = *parsed;
        }

        // Load data
        std::string transactions_file = config->get("transactions_file", "transactions.csv");
        auto transactions = lotbook::ingest::CsvReader::read_file(transactions_file);

        lotbook::core::PriceTable prices;
        std::string prices_file = config->get("prices_file", "prices.csv");
        if (!prices_file.empty()) {
            prices = lotbook::core::PriceTable::from_table(lotbook::ingest::CsvReader::read_file(prices_file));
        }

        lotbook::core::Engine engine;
        engine.configure(settings);

        std::cout << "Running ledger..." << std::endl;
        auto result = engine.run(transactions, prices.as_lookup(), as_of);

        std::string output_directory = config->get("output_directory", "./lotbook_output");
        lotbook::report::CsvReportWriter writer(output_directory, lotbook::report::timestamp_now());
        if (!writer.write(result)) {
            std::cerr << "Failed to write reports to " << output_directory << std::endl;
            return 1;
        }

        // Display results
        std::cout << "Ledger completed as of " << result.as_of.to_string() << "." << std::endl;
        std::cout << "Events: " << result.events << " of " << result.source_rows << " rows" << std::endl;
        std::cout << "Skipped rows: " << result.skipped.size() << std::endl;
        std::cout << "Lots: " << result.tranches.size() << std::endl;
        std::cout << "Allocations: " << result.allocations.rows.size() << std::endl;
        std::cout << "Unallocated dividends: " << result.allocations.unallocated.size() << std::endl;
        std::cout << "Failed symbols: " << result.replay.failures.size() << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
