#include <lotbook/core/transaction.hpp>
#include <algorithm>
#include <cctype>

namespace lotbook::core {

std::optional<EventKind> parse_event_kind(const std::string& text) {
    std::string lowered;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    if (lowered == "buy") return EventKind::BUY;
    if (lowered == "sell") return EventKind::SELL;
    if (lowered == "dividend" || lowered == "div" || lowered == "distribution") {
        return EventKind::DIVIDEND;
    }
    return std::nullopt;
}

std::string to_string(EventKind kind) {
    switch (kind) {
        case EventKind::BUY:
            return "Buy";
        case EventKind::SELL:
            return "Sell";
        case EventKind::DIVIDEND:
            return "Dividend";
    }
    return "";
}

TransactionEvent::TransactionEvent(size_t r, EventKind k, const Date& d, const std::string& sym,
                                   double qty, double px)
    : row(r), kind(k), date(d), symbol(sym), shares(qty), price(px) {}

double TransactionEvent::total_value() const {
    return shares * price;
}

bool chronological(const TransactionEvent& a, const TransactionEvent& b) {
    if (a.date != b.date) {
        return a.date < b.date;
    }
    return a.row < b.row;
}

} // namespace lotbook::core
