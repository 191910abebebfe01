#include <lotbook/core/price_table.hpp>
#include <lotbook/core/errors.hpp>
#include <lotbook/utils/logger.hpp>
#include <lotbook/utils/string_utils.hpp>
#include <optional>
#include <stdexcept>

namespace lotbook::core {

namespace {

std::optional<size_t> find_column(const std::vector<std::string>& header,
                                  const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (utils::to_lower(utils::trim(header[i])) == name) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::string joined(const std::vector<std::string>& header) {
    std::string out;
    for (size_t i = 0; i < header.size(); ++i) {
        if (i > 0) out += ", ";
        out += header[i];
    }
    return out;
}

} // namespace

PriceTable PriceTable::from_table(const RawTable& table) {
    auto sym_col = find_column(table.header, {"sym", "symbol", "ticker"});
    if (!sym_col) {
        throw MissingColumnError("Sym", joined(table.header));
    }
    auto px_col = find_column(table.header, {"currpx", "currentprice", "price", "px"});
    if (!px_col) {
        throw MissingColumnError("CurrPx", joined(table.header));
    }

    PriceTable prices;
    for (size_t i = 0; i < table.rows.size(); ++i) {
        const auto& row = table.rows[i];
        if (*sym_col >= row.size() || *px_col >= row.size()) {
            continue;
        }
        const std::string symbol = utils::to_upper(utils::trim(row[*sym_col]));
        if (symbol.empty()) {
            continue;
        }
        try {
            auto value = utils::parse_amount(row[*px_col]);
            if (value) {
                prices.set_price(symbol, *value);
            }
        } catch (const std::invalid_argument& e) {
            utils::Logger::warn() << "Ignoring price row " << (i + 1) << " for " << symbol
                                  << ": " << e.what() << utils::Logger::endl;
        }
    }

    utils::Logger::debug() << "Loaded " << prices.size() << " prices" << utils::Logger::endl;
    return prices;
}

void PriceTable::set_price(const std::string& symbol, double price) {
    prices_[utils::to_upper(symbol)] = price;
}

double PriceTable::price(const std::string& symbol) const {
    auto it = prices_.find(utils::to_upper(symbol));
    if (it != prices_.end()) {
        return it->second;
    }
    return 0.0;
}

bool PriceTable::contains(const std::string& symbol) const {
    return prices_.find(utils::to_upper(symbol)) != prices_.end();
}

PriceLookup PriceTable::as_lookup() const {
    auto snapshot = prices_;
    return [snapshot](const std::string& symbol) {
        auto it = snapshot.find(utils::to_upper(symbol));
        return it != snapshot.end() ? it->second : 0.0;
    };
}

} // namespace lotbook::core
