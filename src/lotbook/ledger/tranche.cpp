#include <lotbook/ledger/tranche.hpp>
#include <cmath>

namespace lotbook::ledger {

std::string to_string(TrancheStatus status) {
    switch (status) {
        case TrancheStatus::OPEN:
            return "Open";
        case TrancheStatus::PARTIAL:
            return "Partial";
        case TrancheStatus::CLOSED:
            return "Closed";
    }
    return "";
}

TrancheStatus classify(double bought, double remaining) {
    if (std::fabs(remaining) <= kShareEpsilon) {
        return TrancheStatus::CLOSED;
    }
    if (remaining < bought - kShareEpsilon) {
        return TrancheStatus::PARTIAL;
    }
    return TrancheStatus::OPEN;
}

Tranche::Tranche(const std::string& id, const std::string& symbol)
    : id_(id), symbol_(symbol) {}

double Tranche::shares_remaining() const {
    const double remaining = shares_bought_ - shares_sold_;
    return std::fabs(remaining) <= kShareEpsilon ? 0.0 : remaining;
}

double Tranche::average_buy_price() const {
    return shares_bought_ > 0.0 ? cost_basis_ / shares_bought_ : 0.0;
}

TrancheStatus Tranche::status() const {
    return classify(shares_bought_, shares_remaining());
}

double Tranche::bought_as_of(const core::Date& date) const {
    double total = 0.0;
    for (const auto& move : movements_) {
        if (move.shares > 0.0 && move.date <= date) {
            total += move.shares;
        }
    }
    return total;
}

double Tranche::sold_as_of(const core::Date& date) const {
    double total = 0.0;
    for (const auto& move : movements_) {
        if (move.shares < 0.0 && move.date <= date) {
            total -= move.shares;
        }
    }
    return total;
}

double Tranche::remaining_as_of(const core::Date& date) const {
    const double remaining = bought_as_of(date) - sold_as_of(date);
    return remaining <= kShareEpsilon ? 0.0 : remaining;
}

double Tranche::cost_basis_as_of(const core::Date& date) const {
    double total = 0.0;
    for (const auto& move : movements_) {
        if (move.shares > 0.0 && move.date <= date) {
            total += move.shares * move.price;
        }
    }
    return total;
}

TrancheStatus Tranche::status_as_of(const core::Date& date) const {
    return classify(bought_as_of(date), remaining_as_of(date));
}

void Tranche::record_buy(const core::Date& date, size_t row, double shares, double price) {
    shares_bought_ += shares;
    cost_basis_ += shares * price;
    if (!acquisition_date_ || date < *acquisition_date_) {
        acquisition_date_ = date;
    }
    movements_.push_back({date, row, shares, price});
}

void Tranche::record_sell(const core::Date& date, size_t row, double shares, double price) {
    shares_sold_ += shares;
    last_sale_price_ = price;
    movements_.push_back({date, row, -shares, price});
}

void Tranche::accrue_distribution(double income, double roc) {
    cumulative_income_ += income;
    cumulative_roc_ += roc;
}

} // namespace lotbook::ledger
