#pragma once
#include <lotbook/core/date.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lotbook::ledger {

class TrancheBook;
class DistributionAllocator;

enum class TrancheStatus {
    OPEN,
    PARTIAL,
    CLOSED
};

std::string to_string(TrancheStatus status);

// Share tolerance for fractional lots
inline constexpr double kShareEpsilon = 1e-9;

struct LotMovement {
    core::Date date;
    size_t row;
    double shares;  // positive for a buy, negative for a sell
    double price;
};

// One tax lot. Buy/sell state is written only by TrancheBook and
// distribution totals only by DistributionAllocator.
class Tranche {
public:
    Tranche(const std::string& id, const std::string& symbol);

    const std::string& id() const { return id_; }
    const std::string& symbol() const { return symbol_; }
    const std::optional<core::Date>& acquisition_date() const { return acquisition_date_; }

    double shares_bought() const { return shares_bought_; }
    double shares_sold() const { return shares_sold_; }
    double shares_remaining() const;
    double cost_basis() const { return cost_basis_; }
    double average_buy_price() const;
    const std::optional<double>& last_sale_price() const { return last_sale_price_; }
    double cumulative_income() const { return cumulative_income_; }
    double cumulative_roc() const { return cumulative_roc_; }
    TrancheStatus status() const;

    // Views restricted to buys and sells dated on or before date
    double bought_as_of(const core::Date& date) const;
    double sold_as_of(const core::Date& date) const;
    double remaining_as_of(const core::Date& date) const;
    double cost_basis_as_of(const core::Date& date) const;
    TrancheStatus status_as_of(const core::Date& date) const;

    const std::vector<LotMovement>& movements() const { return movements_; }

private:
    friend class TrancheBook;
    friend class DistributionAllocator;

    void record_buy(const core::Date& date, size_t row, double shares, double price);
    void record_sell(const core::Date& date, size_t row, double shares, double price);
    void accrue_distribution(double income, double roc);

    std::string id_;
    std::string symbol_;
    std::optional<core::Date> acquisition_date_;
    double shares_bought_ = 0.0;
    double cost_basis_ = 0.0;
    double shares_sold_ = 0.0;
    std::optional<double> last_sale_price_;
    double cumulative_income_ = 0.0;
    double cumulative_roc_ = 0.0;
    std::vector<LotMovement> movements_;
};

TrancheStatus classify(double bought, double remaining);

} // namespace lotbook::ledger
