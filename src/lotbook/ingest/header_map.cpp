#include <lotbook/ingest/header_map.hpp>
#include <lotbook/core/errors.hpp>
#include <lotbook/utils/string_utils.hpp>

namespace lotbook::ingest {

namespace {

const std::vector<Field> kAllFields = {
    Field::TYPE, Field::DATE, Field::SYMBOL, Field::SHARES, Field::PRICE,
    Field::DISTRIBUTION, Field::DISTRIBUTION_PER_SHARE, Field::INCOME_PER_SHARE, Field::ROC_AMOUNT,
    Field::ROC_PERCENT, Field::TAXABLE, Field::LOT_OVERRIDE
};

} // namespace

std::string field_name(Field field) {
    switch (field) {
        case Field::TYPE: return "Type";
        case Field::DATE: return "Date";
        case Field::SYMBOL: return "Sym";
        case Field::SHARES: return "Shr";
        case Field::PRICE: return "Price";
        case Field::DISTRIBUTION: return "Dist";
        case Field::DISTRIBUTION_PER_SHARE: return "DistPS";
        case Field::INCOME_PER_SHARE: return "IncPS";
        case Field::ROC_AMOUNT: return "ROCAmt";
        case Field::ROC_PERCENT: return "RocPct";
        case Field::TAXABLE: return "Inc";
        case Field::LOT_OVERRIDE: return "TrID";
    }
    return "";
}

const std::vector<std::string>& HeaderMap::synonyms(Field field) {
    static const std::map<Field, std::vector<std::string>> kSynonyms = {
        {Field::TYPE, {"type", "event", "kind"}},
        {Field::DATE, {"date", "distdt", "tradedate"}},
        {Field::SYMBOL, {"sym", "symbol", "ticker"}},
        {Field::SHARES, {"shr", "shares", "qty", "quantity"}},
        {Field::PRICE, {"price", "px"}},
        {Field::DISTRIBUTION, {"dist", "distribution", "divamt", "dividend", "totinc"}},
        {Field::DISTRIBUTION_PER_SHARE, {"distps", "divps"}},
        {Field::INCOME_PER_SHARE, {"incps", "incomepershare"}},
        {Field::ROC_AMOUNT, {"rocamt", "rocamount", "roc"}},
        {Field::ROC_PERCENT, {"rocpct", "rocpercent", "roc%"}},
        {Field::TAXABLE, {"inc", "taxinc", "taxableincome"}},
        {Field::LOT_OVERRIDE, {"trid", "trancheid", "tidoverride", "lotid"}},
    };
    return kSynonyms.at(field);
}

HeaderMap::HeaderMap(const std::vector<std::string>& header) : header_(header) {
    std::vector<std::string> normalized;
    normalized.reserve(header.size());
    for (const auto& name : header) {
        normalized.push_back(utils::to_lower(utils::trim(name)));
    }

    // Earlier synonyms win over later ones, then leftmost column
    for (Field field : kAllFields) {
        bool found = false;
        for (const auto& candidate : synonyms(field)) {
            for (size_t i = 0; i < normalized.size() && !found; ++i) {
                if (normalized[i] == candidate) {
                    columns_[field] = i;
                    found = true;
                }
            }
            if (found) {
                break;
            }
        }
    }
}

std::optional<size_t> HeaderMap::find(Field field) const {
    auto it = columns_.find(field);
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void HeaderMap::require(const std::vector<Field>& fields) const {
    for (Field field : fields) {
        if (!has(field)) {
            throw core::MissingColumnError(field_name(field), joined_headers());
        }
    }
}

std::string HeaderMap::cell(const std::vector<std::string>& row, Field field) const {
    auto column = find(field);
    if (!column || *column >= row.size()) {
        return "";
    }
    return row[*column];
}

std::string HeaderMap::joined_headers() const {
    std::string joined;
    for (size_t i = 0; i < header_.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += header_[i];
    }
    return joined;
}

} // namespace lotbook::ingest
