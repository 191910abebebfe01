#pragma once
#include <lotbook/core/date.hpp>
#include <lotbook/core/price_table.hpp>
#include <lotbook/ledger/tranche.hpp>
#include <lotbook/ledger/tranche_book.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lotbook::ledger {

enum class ExitReadiness {
    READY,
    NOT_READY,
    CLOSED
};

std::string to_string(ExitReadiness readiness);

struct GainSettings {
    // READY once market value reaches this multiple of adjusted basis
    double exit_ready_threshold = 1.0;
};

struct TrancheSnapshot {
    std::string lot_id;
    std::string symbol;
    std::optional<core::Date> acquisition_date;
    double shares_bought = 0.0;
    double shares_sold = 0.0;
    double shares_remaining = 0.0;
    double average_buy_price = 0.0;
    std::optional<double> last_sale_price;
    double current_price = 0.0;
    double cost_basis = 0.0;
    double cumulative_roc = 0.0;
    double adjusted_basis = 0.0;
    double consumed_basis_ratio = 0.0;
    double cumulative_income = 0.0;
    double market_value = 0.0;
    double unrealized_gain = 0.0;
    std::optional<double> realized_gain;
    double percent_to_exit = 0.0;
    TrancheStatus status = TrancheStatus::OPEN;
    std::optional<int64_t> held_days;
    ExitReadiness exit_readiness = ExitReadiness::NOT_READY;
};

// Report-time valuation of lots. Pure: depends only on the lot, the price
// lookup and the as-of date given at construction.
class GainCalculator {
public:
    GainCalculator(core::PriceLookup prices, const core::Date& as_of, GainSettings settings = {});

    TrancheSnapshot evaluate(const Tranche& lot) const;

    // Ordered by symbol, acquisition date, lot id
    std::vector<TrancheSnapshot> evaluate_all(const TrancheBook& book) const;

private:
    core::PriceLookup prices_;
    core::Date as_of_;
    GainSettings settings_;
};

} // namespace lotbook::ledger
