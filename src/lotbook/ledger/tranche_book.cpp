#include <lotbook/ledger/tranche_book.hpp>
#include <lotbook/core/errors.hpp>
#include <lotbook/utils/logger.hpp>
#include <algorithm>
#include <stdexcept>

namespace lotbook::ledger {

std::string sequence_letter(size_t index) {
    std::string letters;
    size_t n = index + 1;
    while (n > 0) {
        --n;
        letters.insert(letters.begin(), static_cast<char>('A' + n % 26));
        n /= 26;
    }
    return letters;
}

TrancheBook::TrancheBook(BookSettings settings) : settings_(settings) {}

void TrancheBook::clear() {
    lots_.clear();
    lots_by_symbol_.clear();
    sequence_.clear();
    latest_lot_.clear();
    lot_for_row_.clear();
    failed_symbols_.clear();
}

ReplayReport TrancheBook::replay(const std::vector<core::TransactionEvent>& events) {
    clear();

    std::map<std::string, std::vector<core::TransactionEvent>> by_symbol;
    for (const auto& event : events) {
        if (event.is_trade()) {
            by_symbol[event.symbol].push_back(event);
        }
    }

    ReplayReport report;
    for (auto& [symbol, trades] : by_symbol) {
        std::stable_sort(trades.begin(), trades.end(), core::chronological);

        size_t buys = 0;
        size_t sells = 0;
        try {
            for (const auto& trade : trades) {
                apply(trade);
                if (trade.kind == core::EventKind::BUY) {
                    ++buys;
                } else {
                    ++sells;
                }
            }
            report.buys += buys;
            report.sells += sells;
        } catch (const core::LotResolutionError& e) {
            utils::Logger::error() << "Ledger for " << symbol << " abandoned: " << e.what()
                                   << utils::Logger::endl;
            SymbolFailure failure{symbol, e.row(), e.date(), e.lot_id(), e.what()};
            drop_symbol(symbol);
            failed_symbols_[symbol] = failure;
            report.failures.push_back(failure);
        }
    }

    utils::Logger::info() << "Replayed " << report.buys << " buys and " << report.sells
                          << " sells into " << lots_.size() << " lots" << utils::Logger::endl;
    return report;
}

const std::string& TrancheBook::apply(const core::TransactionEvent& event) {
    switch (event.kind) {
        case core::EventKind::BUY:
            return apply_buy(event);
        case core::EventKind::SELL:
            return apply_sell(event);
        case core::EventKind::DIVIDEND:
            break;
    }
    throw std::invalid_argument("TrancheBook only applies Buy and Sell events (row " +
                                std::to_string(event.row) + ")");
}

const std::string& TrancheBook::apply_buy(const core::TransactionEvent& event) {
    std::string lot_id;
    if (event.lot_id_override) {
        lot_id = *event.lot_id_override;
        auto existing = lots_.find(lot_id);
        if (existing != lots_.end() && existing->second.symbol() != event.symbol) {
            throw core::UnknownLotError(event.row, event.date, event.symbol, lot_id,
                                        "lot belongs to " + existing->second.symbol());
        }
        // Closed is terminal
        if (existing != lots_.end() && existing->second.status() == TrancheStatus::CLOSED) {
            throw core::ClosedLotError(event.row, event.date, event.symbol, lot_id);
        }
    } else {
        lot_id = derive_lot_id(event.symbol, event.date);
    }

    auto it = lots_.find(lot_id);
    if (it == lots_.end()) {
        it = lots_.emplace(lot_id, Tranche(lot_id, event.symbol)).first;
        lots_by_symbol_[event.symbol].push_back(lot_id);
        utils::Logger::debug() << "Opened lot " << lot_id << " at row " << event.row
                               << utils::Logger::endl;
    }

    it->second.record_buy(event.date, event.row, event.shares, event.price);
    latest_lot_[event.symbol] = lot_id;
    lot_for_row_[event.row] = lot_id;
    return it->first;
}

const std::string& TrancheBook::apply_sell(const core::TransactionEvent& event) {
    std::string lot_id;
    if (event.lot_id_override) {
        lot_id = *event.lot_id_override;
    } else {
        auto latest = latest_lot_.find(event.symbol);
        if (latest == latest_lot_.end()) {
            throw core::UnknownLotError(event.row, event.date, event.symbol, "",
                                        "no lot has been established for the symbol");
        }
        if (settings_.strict_sell_resolution) {
            size_t holding = 0;
            for (const auto& id : lots_by_symbol_[event.symbol]) {
                if (lots_.at(id).shares_remaining() > 0.0) {
                    ++holding;
                }
            }
            if (holding > 1) {
                throw core::AmbiguousLotError(event.row, event.date, event.symbol, holding);
            }
        }
        lot_id = latest->second;
    }

    auto it = lots_.find(lot_id);
    if (it == lots_.end()) {
        throw core::UnknownLotError(event.row, event.date, event.symbol, lot_id,
                                    "lot id was never established by a prior Buy");
    }
    Tranche& lot = it->second;
    if (lot.symbol() != event.symbol) {
        throw core::UnknownLotError(event.row, event.date, event.symbol, lot_id,
                                    "lot belongs to " + lot.symbol());
    }

    const double available = lot.shares_remaining();
    if (event.shares > available + kShareEpsilon) {
        throw core::OverSellError(event.row, event.date, event.symbol, lot_id,
                                  event.shares, available);
    }

    lot.record_sell(event.date, event.row, event.shares, event.price);
    lot_for_row_[event.row] = lot_id;
    if (lot.status() == TrancheStatus::CLOSED) {
        utils::Logger::debug() << "Closed lot " << lot_id << " at row " << event.row
                               << utils::Logger::endl;
    }
    return it->first;
}

std::string TrancheBook::derive_lot_id(const std::string& symbol, const core::Date& date) {
    const std::string prefix = symbol + "_" + date.compact();
    size_t& count = sequence_[{symbol, date.compact()}];

    // Skip letters already claimed through an override
    std::string lot_id = prefix + "_" + sequence_letter(count);
    while (lots_.find(lot_id) != lots_.end()) {
        ++count;
        lot_id = prefix + "_" + sequence_letter(count);
    }
    ++count;
    return lot_id;
}

void TrancheBook::drop_symbol(const std::string& symbol) {
    auto ids = lots_by_symbol_.find(symbol);
    if (ids != lots_by_symbol_.end()) {
        for (const auto& id : ids->second) {
            lots_.erase(id);
        }
        lots_by_symbol_.erase(ids);
    }

    for (auto it = lot_for_row_.begin(); it != lot_for_row_.end();) {
        if (lots_.find(it->second) == lots_.end()) {
            it = lot_for_row_.erase(it);
        } else {
            ++it;
        }
    }

    latest_lot_.erase(symbol);
    for (auto it = sequence_.begin(); it != sequence_.end();) {
        if (it->first.first == symbol) {
            it = sequence_.erase(it);
        } else {
            ++it;
        }
    }
}

const Tranche* TrancheBook::find(const std::string& lot_id) const {
    auto it = lots_.find(lot_id);
    return it != lots_.end() ? &it->second : nullptr;
}

std::vector<const Tranche*> TrancheBook::lots() const {
    std::vector<const Tranche*> out;
    out.reserve(lots_.size());
    for (const auto& [id, lot] : lots_) {
        out.push_back(&lot);
    }
    return out;
}

std::vector<const Tranche*> TrancheBook::lots_for_symbol(const std::string& symbol) const {
    std::vector<const Tranche*> out;
    auto ids = lots_by_symbol_.find(symbol);
    if (ids == lots_by_symbol_.end()) {
        return out;
    }
    for (const auto& id : ids->second) {
        out.push_back(&lots_.at(id));
    }
    return out;
}

std::vector<LotHolding> TrancheBook::holdings_as_of(const std::string& symbol, const core::Date& date) {
    std::vector<LotHolding> out;
    auto ids = lots_by_symbol_.find(symbol);
    if (ids == lots_by_symbol_.end()) {
        return out;
    }
    for (const auto& id : ids->second) {
        Tranche& lot = lots_.at(id);
        const double remaining = lot.remaining_as_of(date);
        if (remaining > 0.0) {
            out.push_back({&lot, remaining});
        }
    }
    return out;
}

std::string TrancheBook::lot_for_row(size_t row) const {
    auto it = lot_for_row_.find(row);
    return it != lot_for_row_.end() ? it->second : std::string();
}

bool TrancheBook::symbol_failed(const std::string& symbol) const {
    return failed_symbols_.find(symbol) != failed_symbols_.end();
}

} // namespace lotbook::ledger
