#include <lotbook/ledger/income_aggregator.hpp>
#include <lotbook/utils/logger.hpp>
#include <tuple>

namespace lotbook::ledger {

bool WeekSymbolKey::operator==(const WeekSymbolKey& other) const {
    return week_start == other.week_start && symbol == other.symbol;
}

bool WeekSymbolKey::operator<(const WeekSymbolKey& other) const {
    return std::tie(week_start, symbol) < std::tie(other.week_start, other.symbol);
}

bool YearSymbolKey::operator==(const YearSymbolKey& other) const {
    return year == other.year && symbol == other.symbol;
}

bool YearSymbolKey::operator<(const YearSymbolKey& other) const {
    return std::tie(year, symbol) < std::tie(other.year, other.symbol);
}

IncomeAmounts& IncomeAmounts::operator+=(const IncomeAmounts& other) {
    distribution += other.distribution;
    taxable += other.taxable;
    roc += other.roc;
    return *this;
}

double WeeklyAggregate::income_per_share() const {
    return shares_eligible > 0.0 ? amounts.distribution / shares_eligible : 0.0;
}

void IncomeAggregator::add(const AllocationRow& row) {
    const WeekSymbolKey key{row.week_start, row.symbol};
    auto it = weekly_.find(key);
    if (it == weekly_.end()) {
        WeeklyAggregate fresh;
        fresh.key = key;
        it = weekly_.emplace(key, fresh).first;
    }

    WeeklyAggregate& group = it->second;
    group.amounts += IncomeAmounts{row.distribution_amount, row.income_amount, row.roc_amount};
    group.shares_eligible += row.remaining_at_date;
    group.tranche_count += 1;

    auto& rows = dividend_rows_[key];
    rows.insert(row.dividend_row);
    group.event_count = rows.size();
}

void IncomeAggregator::add_all(const std::vector<AllocationRow>& rows) {
    for (const auto& row : rows) {
        add(row);
    }
}

std::vector<IncomeRow> IncomeAggregator::build() {
    week_totals_.clear();
    ytd_by_symbol_.clear();
    ytd_all_.clear();

    for (const auto& [key, group] : weekly_) {
        week_totals_[key.week_start] += group.amounts;
    }

    std::vector<IncomeRow> out;
    out.reserve(weekly_.size());
    for (const auto& [key, group] : weekly_) {
        const int year = key.week_start.year();
        IncomeAmounts& ytd_symbol = ytd_by_symbol_[YearSymbolKey{year, key.symbol}];
        IncomeAmounts& ytd_all = ytd_all_[year];
        ytd_symbol += group.amounts;
        ytd_all += group.amounts;

        IncomeRow row;
        row.week_start = key.week_start;
        row.year = year;
        row.symbol = key.symbol;
        row.weekly = group.amounts;
        row.week_all = week_totals_[key.week_start];
        row.ytd_symbol = ytd_symbol;
        row.ytd_all = ytd_all;
        row.shares_eligible = group.shares_eligible;
        row.income_per_share = group.income_per_share();
        row.tranche_count = group.tranche_count;
        row.event_count = group.event_count;
        out.push_back(row);
    }

    utils::Logger::info() << "Aggregated " << out.size() << " weekly income rows across "
                          << ytd_all_.size() << " years" << utils::Logger::endl;
    return out;
}

void IncomeAggregator::clear() {
    weekly_.clear();
    dividend_rows_.clear();
    week_totals_.clear();
    ytd_by_symbol_.clear();
    ytd_all_.clear();
}

} // namespace lotbook::ledger
