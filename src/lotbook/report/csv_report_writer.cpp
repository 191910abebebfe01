#include <lotbook/report/csv_report_writer.hpp>
#include <lotbook/utils/logger.hpp>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <utility>

namespace lotbook::report {

namespace {

std::string fixed(double value, int places) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(places) << value;
    return oss.str();
}

std::string money(double value) { return fixed(value, 2); }
std::string per_share(double value) { return fixed(value, 4); }
std::string shares(double value) { return fixed(value, 4); }

std::string optional_money(const std::optional<double>& value) {
    return value ? money(*value) : "";
}

std::string optional_per_share(const std::optional<double>& value) {
    return value ? per_share(*value) : "";
}

} // namespace

std::string timestamp_now() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

CsvReportWriter::CsvReportWriter(std::string output_directory, std::string generated_at)
    : output_directory_(std::move(output_directory)), generated_at_(std::move(generated_at)) {}

std::string CsvReportWriter::escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "\"";
    return quoted;
}

bool CsvReportWriter::write(const core::RunResult& result) const {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        utils::Logger::error() << "Failed to create output directory " << output_directory_ << ": "
                               << ec.message() << utils::Logger::endl;
        return false;
    }

    const std::vector<std::pair<std::string, std::function<void(std::ostream&)>>> files = {
        {"tranches.csv", [&](std::ostream& out) { write_tranches(out, result.tranches); }},
        {"allocations.csv", [&](std::ostream& out) { write_allocations(out, result.allocations.rows); }},
        {"income.csv", [&](std::ostream& out) { write_income(out, result.income); }},
        {"symbols.csv", [&](std::ostream& out) { write_symbols(out, result.symbols); }},
        {"transactions.csv", [&](std::ostream& out) { write_transactions(out, result.transactions); }},
        {"diagnostics.csv", [&](std::ostream& out) { write_diagnostics(out, result); }},
    };

    bool ok = true;
    for (const auto& [name, writer] : files) {
        const std::string path = (std::filesystem::path(output_directory_) / name).string();
        std::ofstream file(path);
        if (!file.is_open()) {
            utils::Logger::error() << "Failed to create CSV file: " << path << utils::Logger::endl;
            ok = false;
            continue;
        }
        writer(file);
        file.close();
        if (!file) {
            utils::Logger::error() << "Failed to write CSV file: " << path << utils::Logger::endl;
            ok = false;
            continue;
        }
        utils::Logger::info() << "Exported " << path << utils::Logger::endl;
    }
    return ok;
}

void CsvReportWriter::write_tranches(std::ostream& out,
                                     const std::vector<ledger::TrancheSnapshot>& rows) const {
    out << "ID,Sym,BuyDt,ShBuy,BuyPx,ShSold,SellPx,ShRem,CurrPx,CostBasis,ROC,AdjBasis,"
           "ConsumedBasis,CumIncome,MktValue,UnrealizedGainLoss,RealizedGainLoss,PctToExit,"
           "Status,HeldDays,ExitReady,GeneratedAt\n";
    for (const auto& row : rows) {
        out << escape(row.lot_id) << ','
            << escape(row.symbol) << ','
            << (row.acquisition_date ? row.acquisition_date->to_string() : "") << ','
            << shares(row.shares_bought) << ','
            << per_share(row.average_buy_price) << ','
            << shares(row.shares_sold) << ','
            << optional_per_share(row.last_sale_price) << ','
            << shares(row.shares_remaining) << ','
            << per_share(row.current_price) << ','
            << money(row.cost_basis) << ','
            << money(row.cumulative_roc) << ','
            << money(row.adjusted_basis) << ','
            << fixed(row.consumed_basis_ratio, 4) << ','
            << money(row.cumulative_income) << ','
            << money(row.market_value) << ','
            << money(row.unrealized_gain) << ','
            << optional_money(row.realized_gain) << ','
            << fixed(row.percent_to_exit, 4) << ','
            << ledger::to_string(row.status) << ','
            << (row.held_days ? std::to_string(*row.held_days) : "") << ','
            << ledger::to_string(row.exit_readiness) << ','
            << generated_at_ << '\n';
    }
}

void CsvReportWriter::write_allocations(std::ostream& out,
                                        const std::vector<ledger::AllocationRow>& rows) const {
    out << "WkStart,DistDt,TrID,Sym,CostBasis,DistPS,IncPS,RocPS,Dist,Inc,ROCAmt,ROCPct,"
           "TotShr,RemShr,TStat,SourceRow,GeneratedAt\n";
    for (const auto& row : rows) {
        out << row.week_start.to_string() << ','
            << row.distribution_date.to_string() << ','
            << escape(row.lot_id) << ','
            << escape(row.symbol) << ','
            << money(row.cost_basis) << ','
            << per_share(row.dist_per_share) << ','
            << per_share(row.income_per_share) << ','
            << per_share(row.roc_per_share) << ','
            << money(row.distribution_amount) << ','
            << money(row.income_amount) << ','
            << money(row.roc_amount) << ','
            << fixed(row.roc_percent, 4) << ','
            << shares(row.shares_bought) << ','
            << shares(row.remaining_at_date) << ','
            << ledger::to_string(row.status_at_date) << ','
            << row.dividend_row << ','
            << generated_at_ << '\n';
    }
}

void CsvReportWriter::write_income(std::ostream& out, const std::vector<ledger::IncomeRow>& rows) const {
    out << "Wk,Year,Sym,WkInc,WkTaxInc,WkROC,WkAllInc,WkAllTaxInc,WkAllROC,"
           "YTDsym,YTDsymTaxInc,YTDsymROC,YTDinc,YTDTaxInc,YTDROC,ShElig,IncPS,TrCnt,EvtCnt,"
           "GeneratedAt\n";
    for (const auto& row : rows) {
        out << row.week_start.to_string() << ','
            << row.year << ','
            << escape(row.symbol) << ','
            << money(row.weekly.distribution) << ','
            << money(row.weekly.taxable) << ','
            << money(row.weekly.roc) << ','
            << money(row.week_all.distribution) << ','
            << money(row.week_all.taxable) << ','
            << money(row.week_all.roc) << ','
            << money(row.ytd_symbol.distribution) << ','
            << money(row.ytd_symbol.taxable) << ','
            << money(row.ytd_symbol.roc) << ','
            << money(row.ytd_all.distribution) << ','
            << money(row.ytd_all.taxable) << ','
            << money(row.ytd_all.roc) << ','
            << shares(row.shares_eligible) << ','
            << per_share(row.income_per_share) << ','
            << row.tranche_count << ','
            << row.event_count << ','
            << generated_at_ << '\n';
    }
}

void CsvReportWriter::write_symbols(std::ostream& out,
                                    const std::vector<ledger::SymbolSummaryRow>& rows) const {
    out << "Sym,TotInc,TaxInc,ROC,ROCRatio,Dividends,Allocations,Unallocated,UnallocatedDist,"
           "Lots,OpenLots,ShRem,LedgerFailed,GeneratedAt\n";
    for (const auto& row : rows) {
        out << escape(row.symbol) << ','
            << money(row.distribution) << ','
            << money(row.taxable) << ','
            << money(row.roc) << ','
            << fixed(row.roc_ratio, 4) << ','
            << row.dividend_count << ','
            << row.allocation_count << ','
            << row.unallocated_count << ','
            << money(row.unallocated_distribution) << ','
            << row.lot_count << ','
            << row.open_lot_count << ','
            << shares(row.shares_remaining) << ','
            << (row.ledger_failed ? "true" : "false") << ','
            << generated_at_ << '\n';
    }
}

void CsvReportWriter::write_transactions(std::ostream& out,
                                         const std::vector<ledger::AnnotatedTransaction>& rows) const {
    out << "Row,Date,Type,Sym,Shr,Price,WkStart,TrID,CostBasis,Dist,Inc,ROCAmt,DistPS,IncPS,RocPS,"
           "TotShr,RemShr,TStat,GeneratedAt\n";
    for (const auto& row : rows) {
        const bool trade = row.kind != core::EventKind::DIVIDEND;
        out << row.row << ','
            << row.date.to_string() << ','
            << core::to_string(row.kind) << ','
            << escape(row.symbol) << ','
            << (trade ? shares(row.shares) : "") << ','
            << (trade ? per_share(row.price) : "") << ','
            << row.week_start.to_string() << ','
            << escape(row.lot_id) << ','
            << (row.kind == core::EventKind::BUY ? money(row.cost) : "") << ','
            << optional_money(row.distribution) << ','
            << optional_money(row.taxable) << ','
            << optional_money(row.roc) << ','
            << optional_per_share(row.dist_per_share) << ','
            << optional_per_share(row.income_per_share) << ','
            << optional_per_share(row.roc_per_share) << ','
            << shares(row.running_shares) << ','
            << (row.lot_remaining ? shares(*row.lot_remaining) : "") << ','
            << (row.lot_status ? ledger::to_string(*row.lot_status) : "") << ','
            << generated_at_ << '\n';
    }
}

void CsvReportWriter::write_diagnostics(std::ostream& out, const core::RunResult& result) const {
    out << "Kind,Row,Date,Sym,Rule,Amount,Message,GeneratedAt\n";
    for (const auto& skipped : result.skipped) {
        out << "MalformedRow," << skipped.row << ",,," << escape(skipped.rule) << ",,"
            << escape(skipped.message) << ',' << generated_at_ << '\n';
    }
    for (const auto& failure : result.replay.failures) {
        out << "SymbolLedgerFailed," << failure.row << ',' << failure.date.to_string() << ','
            << escape(failure.symbol) << ",lot," << ',' << escape(failure.message) << ','
            << generated_at_ << '\n';
    }
    for (const auto& missed : result.allocations.unallocated) {
        out << "UnallocatedDividend," << missed.row << ',' << missed.date.to_string() << ','
            << escape(missed.symbol) << ",allocation," << money(missed.distribution) << ','
            << escape(missed.reason) << ',' << generated_at_ << '\n';
    }
}

} // namespace lotbook::report
