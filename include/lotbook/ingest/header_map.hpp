#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lotbook::ingest {

enum class Field {
    TYPE,
    DATE,
    SYMBOL,
    SHARES,
    PRICE,
    DISTRIBUTION,
    DISTRIBUTION_PER_SHARE,
    INCOME_PER_SHARE,
    ROC_AMOUNT,
    ROC_PERCENT,
    TAXABLE,
    LOT_OVERRIDE
};

std::string field_name(Field field);

// Resolves canonical fields to column positions. Header matching ignores
// case and surrounding whitespace and accepts the known synonyms per field.
class HeaderMap {
public:
    explicit HeaderMap(const std::vector<std::string>& header);

    std::optional<size_t> find(Field field) const;
    bool has(Field field) const { return find(field).has_value(); }

    // Throws MissingColumnError naming the first absent field
    void require(const std::vector<Field>& fields) const;

    // Cell for field in row, empty when the column is absent or the row is short
    std::string cell(const std::vector<std::string>& row, Field field) const;

    std::string joined_headers() const;

    static const std::vector<std::string>& synonyms(Field field);

private:
    std::vector<std::string> header_;
    std::map<Field, size_t> columns_;
};

} // namespace lotbook::ingest
