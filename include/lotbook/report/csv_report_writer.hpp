#pragma once
#include <lotbook/core/engine.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace lotbook::report {

// Writes a run's row sets as CSV files. Every row carries the GeneratedAt
// stamp given at construction; nothing else depends on the wall clock.
class CsvReportWriter {
public:
    CsvReportWriter(std::string output_directory, std::string generated_at);

    // Creates the directory if needed. Returns false if any file could not be written.
    bool write(const core::RunResult& result) const;

    void write_tranches(std::ostream& out, const std::vector<ledger::TrancheSnapshot>& rows) const;
    void write_allocations(std::ostream& out, const std::vector<ledger::AllocationRow>& rows) const;
    void write_income(std::ostream& out, const std::vector<ledger::IncomeRow>& rows) const;
    void write_symbols(std::ostream& out, const std::vector<ledger::SymbolSummaryRow>& rows) const;
    void write_transactions(std::ostream& out,
                            const std::vector<ledger::AnnotatedTransaction>& rows) const;
    void write_diagnostics(std::ostream& out, const core::RunResult& result) const;

    static std::string escape(const std::string& field);

private:
    std::string output_directory_;
    std::string generated_at_;
};

// Local time as YYYY-MM-DD HH:MM:SS
std::string timestamp_now();

} // namespace lotbook::report
