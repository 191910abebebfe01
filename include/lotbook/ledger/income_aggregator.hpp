#pragma once
#include <lotbook/core/date.hpp>
#include <lotbook/ledger/distribution_allocator.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace lotbook::ledger {

struct WeekSymbolKey {
    core::Date week_start;
    std::string symbol;

    bool operator==(const WeekSymbolKey& other) const;
    bool operator<(const WeekSymbolKey& other) const;
};

struct YearSymbolKey {
    int year = 0;
    std::string symbol;

    bool operator==(const YearSymbolKey& other) const;
    bool operator<(const YearSymbolKey& other) const;
};

struct IncomeAmounts {
    double distribution = 0.0;
    double taxable = 0.0;
    double roc = 0.0;

    IncomeAmounts& operator+=(const IncomeAmounts& other);
};

struct WeeklyAggregate {
    WeekSymbolKey key;
    IncomeAmounts amounts;
    double shares_eligible = 0.0;
    size_t tranche_count = 0;
    size_t event_count = 0;

    double income_per_share() const;
};

struct IncomeRow {
    core::Date week_start;
    int year = 0;
    std::string symbol;
    IncomeAmounts weekly;
    IncomeAmounts week_all;
    IncomeAmounts ytd_symbol;
    IncomeAmounts ytd_all;
    double shares_eligible = 0.0;
    double income_per_share = 0.0;
    size_t tranche_count = 0;
    size_t event_count = 0;
};

/**
 * Rolls allocation rows up per (week, symbol) and keeps running year-to-date
 * totals per (year, symbol) and per year. The year of a group is the year of
 * its week start.
 *
 * build() walks the weekly groups once in ascending week order, so every
 * running total only grows within a year.
 */
class IncomeAggregator {
public:
    void add(const AllocationRow& row);
    void add_all(const std::vector<AllocationRow>& rows);

    std::vector<IncomeRow> build();

    const std::map<WeekSymbolKey, WeeklyAggregate>& weekly() const { return weekly_; }
    const std::map<core::Date, IncomeAmounts>& week_totals() const { return week_totals_; }
    const std::map<YearSymbolKey, IncomeAmounts>& ytd_by_symbol() const { return ytd_by_symbol_; }
    const std::map<int, IncomeAmounts>& ytd_all() const { return ytd_all_; }

    void clear();

private:
    std::map<WeekSymbolKey, WeeklyAggregate> weekly_;
    std::map<WeekSymbolKey, std::set<size_t>> dividend_rows_;
    std::map<core::Date, IncomeAmounts> week_totals_;
    std::map<YearSymbolKey, IncomeAmounts> ytd_by_symbol_;
    std::map<int, IncomeAmounts> ytd_all_;
};

} // namespace lotbook::ledger
