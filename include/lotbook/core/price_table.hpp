#pragma once
#include <lotbook/core/raw_table.hpp>
#include <functional>
#include <string>
#include <unordered_map>

namespace lotbook::core {

// symbol -> current price, 0 when the symbol is unknown
using PriceLookup = std::function<double(const std::string&)>;

class PriceTable {
public:
    PriceTable() = default;

    // Expects a symbol column (Sym/Symbol/Ticker) and a price column
    // (CurrPx/Price/CurrentPrice). Rows with a blank or unparsable price are ignored.
    static PriceTable from_table(const RawTable& table);

    void set_price(const std::string& symbol, double price);
    double price(const std::string& symbol) const;
    bool contains(const std::string& symbol) const;
    size_t size() const { return prices_.size(); }

    // The returned lookup copies the table
    PriceLookup as_lookup() const;

private:
    std::unordered_map<std::string, double> prices_;
};

} // namespace lotbook::core
