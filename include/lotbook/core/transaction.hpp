#pragma once

#include <lotbook/core/date.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace lotbook::core {

enum class EventKind {
    BUY,
    SELL,
    DIVIDEND
};

std::optional<EventKind> parse_event_kind(const std::string& text);
std::string to_string(EventKind kind);

struct TransactionEvent {
    size_t row = 0;  // 1-based data row in the source table
    EventKind kind = EventKind::BUY;
    Date date;
    std::string symbol;

    // Buy / Sell
    double shares = 0.0;
    double price = 0.0;
    std::optional<std::string> lot_id_override;

    // Dividend
    std::optional<double> dividend_total;
    std::optional<double> dividend_per_share;
    std::optional<double> income_per_share;  // taxable part per share, grossed up by roc_percent
    std::optional<double> roc_amount;
    std::optional<double> roc_percent;
    std::optional<double> taxable_amount;

    TransactionEvent() = default;
    TransactionEvent(size_t r, EventKind k, const Date& d, const std::string& sym,
                     double qty = 0.0, double px = 0.0);

    bool is_trade() const { return kind != EventKind::DIVIDEND; }
    double total_value() const;
};

// Chronological order with source row as tie-break
bool chronological(const TransactionEvent& a, const TransactionEvent& b);

} // namespace lotbook::core
