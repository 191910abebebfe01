#include <lotbook/ledger/gain_calculator.hpp>
#include <algorithm>
#include <tuple>
#include <utility>

namespace lotbook::ledger {

std::string to_string(ExitReadiness readiness) {
    switch (readiness) {
        case ExitReadiness::READY:
            return "Ready";
        case ExitReadiness::NOT_READY:
            return "NotReady";
        case ExitReadiness::CLOSED:
            return "Closed";
    }
    return "";
}

GainCalculator::GainCalculator(core::PriceLookup prices, const core::Date& as_of, GainSettings settings)
    : prices_(std::move(prices)), as_of_(as_of), settings_(settings) {}

TrancheSnapshot GainCalculator::evaluate(const Tranche& lot) const {
    TrancheSnapshot snap;
    snap.lot_id = lot.id();
    snap.symbol = lot.symbol();
    snap.acquisition_date = lot.acquisition_date();
    snap.shares_bought = lot.shares_bought();
    snap.shares_sold = lot.shares_sold();
    snap.shares_remaining = lot.shares_remaining();
    snap.average_buy_price = lot.average_buy_price();
    snap.last_sale_price = lot.last_sale_price();
    snap.current_price = prices_ ? prices_(lot.symbol()) : 0.0;
    snap.cost_basis = lot.cost_basis();
    snap.cumulative_roc = lot.cumulative_roc();
    snap.cumulative_income = lot.cumulative_income();
    snap.status = lot.status();

    snap.adjusted_basis = snap.cost_basis - snap.cumulative_roc;
    snap.consumed_basis_ratio = snap.cost_basis != 0.0 ? snap.cumulative_roc / snap.cost_basis : 0.0;
    snap.market_value = snap.shares_remaining * snap.current_price;
    snap.unrealized_gain = snap.market_value - snap.adjusted_basis;

    if (snap.shares_sold > 0.0 && snap.last_sale_price) {
        snap.realized_gain = (*snap.last_sale_price - snap.average_buy_price) * snap.shares_sold;
    }

    // Principal at risk if sold now, excluding income received
    if (snap.adjusted_basis > 0.0) {
        const double raw = (snap.adjusted_basis - snap.market_value) / snap.adjusted_basis;
        snap.percent_to_exit = std::clamp(raw, 0.0, 1.0);
    }

    if (snap.acquisition_date) {
        snap.held_days = snap.acquisition_date->days_until(as_of_);
    }

    if (snap.status == TrancheStatus::CLOSED) {
        snap.exit_readiness = ExitReadiness::CLOSED;
    } else if (snap.adjusted_basis <= 0.0 ||
               snap.market_value >= settings_.exit_ready_threshold * snap.adjusted_basis) {
        snap.exit_readiness = ExitReadiness::READY;
    } else {
        snap.exit_readiness = ExitReadiness::NOT_READY;
    }

    return snap;
}

std::vector<TrancheSnapshot> GainCalculator::evaluate_all(const TrancheBook& book) const {
    std::vector<TrancheSnapshot> out;
    for (const Tranche* lot : book.lots()) {
        out.push_back(evaluate(*lot));
    }

    std::stable_sort(out.begin(), out.end(), [](const TrancheSnapshot& a, const TrancheSnapshot& b) {
        // Lots without an acquisition date sort first within a symbol
        const core::Date a_date = a.acquisition_date.value_or(core::Date(1, 1, 1));
        const core::Date b_date = b.acquisition_date.value_or(core::Date(1, 1, 1));
        return std::tie(a.symbol, a_date, a.lot_id) < std::tie(b.symbol, b_date, b.lot_id);
    });
    return out;
}

} // namespace lotbook::ledger
