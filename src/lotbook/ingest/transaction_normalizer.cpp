#include <lotbook/ingest/transaction_normalizer.hpp>
#include <lotbook/core/errors.hpp>
#include <lotbook/utils/logger.hpp>
#include <lotbook/utils/string_utils.hpp>
#include <optional>
#include <stdexcept>

namespace lotbook::ingest {

namespace {

bool is_blank_row(const std::vector<std::string>& row) {
    for (const auto& cell : row) {
        if (!utils::trim(cell).empty()) {
            return false;
        }
    }
    return true;
}

std::optional<double> amount_cell(const HeaderMap& columns, const std::vector<std::string>& row,
                                  Field field, size_t row_number) {
    const std::string text = columns.cell(row, field);
    try {
        return utils::parse_amount(text);
    } catch (const std::invalid_argument&) {
        throw core::MalformedRowError(row_number, field_name(field),
                                      "cannot parse '" + text + "' as a number");
    }
}

std::optional<double> non_negative(const HeaderMap& columns, const std::vector<std::string>& row,
                                   Field field, size_t row_number) {
    auto value = amount_cell(columns, row, field, row_number);
    if (value && *value < 0.0) {
        throw core::MalformedRowError(row_number, field_name(field),
                                      "negative value " + columns.cell(row, field));
    }
    return value;
}

} // namespace

const std::vector<Field>& TransactionNormalizer::required_fields() {
    static const std::vector<Field> kRequired = {
        Field::TYPE, Field::DATE, Field::SYMBOL, Field::SHARES, Field::PRICE
    };
    return kRequired;
}

NormalizedLog TransactionNormalizer::normalize(const core::RawTable& table) const {
    HeaderMap columns(table.header);
    columns.require(required_fields());

    NormalizedLog log;
    log.events.reserve(table.rows.size());

    for (size_t i = 0; i < table.rows.size(); ++i) {
        const size_t row_number = i + 1;
        const auto& row = table.rows[i];
        if (is_blank_row(row)) {
            ++log.blank_rows;
            continue;
        }

        try {
            log.events.push_back(normalize_row(columns, row, row_number));
        } catch (const core::MalformedRowError& e) {
            utils::Logger::warn() << "Skipping transaction " << e.what() << utils::Logger::endl;
            log.skipped.push_back({row_number, e.rule(), e.what()});
        }
    }

    utils::Logger::info() << "Normalized " << log.events.size() << " transactions, skipped "
                          << log.skipped.size() << utils::Logger::endl;
    return log;
}

core::TransactionEvent TransactionNormalizer::normalize_row(const HeaderMap& columns,
                                                            const std::vector<std::string>& row,
                                                            size_t row_number) {
    core::TransactionEvent event;
    event.row = row_number;

    const std::string type_text = columns.cell(row, Field::TYPE);
    auto kind = core::parse_event_kind(type_text);
    if (!kind) {
        throw core::MalformedRowError(row_number, "Type", "unknown event type '" + type_text + "'");
    }
    event.kind = *kind;

    const std::string date_text = columns.cell(row, Field::DATE);
    auto date = core::Date::parse(date_text);
    if (!date) {
        throw core::MalformedRowError(row_number, "Date", "unparsable date '" + date_text + "'");
    }
    event.date = *date;

    event.symbol = utils::to_upper(utils::trim(columns.cell(row, Field::SYMBOL)));
    if (event.symbol.empty()) {
        throw core::MalformedRowError(row_number, "Sym", "blank symbol");
    }

    if (event.is_trade()) {
        auto shares = amount_cell(columns, row, Field::SHARES, row_number);
        if (!shares || *shares <= 0.0) {
            throw core::MalformedRowError(row_number, "Shr",
                                          "share count must be positive for a " +
                                              core::to_string(event.kind));
        }
        auto price = non_negative(columns, row, Field::PRICE, row_number);
        if (!price) {
            throw core::MalformedRowError(row_number, "Price",
                                          "missing price for a " + core::to_string(event.kind));
        }
        event.shares = *shares;
        event.price = *price;

        const std::string override_id = utils::trim(columns.cell(row, Field::LOT_OVERRIDE));
        if (!override_id.empty()) {
            event.lot_id_override = override_id;
        }
        return event;
    }

    event.dividend_total = non_negative(columns, row, Field::DISTRIBUTION, row_number);
    event.dividend_per_share = non_negative(columns, row, Field::DISTRIBUTION_PER_SHARE, row_number);
    event.income_per_share = non_negative(columns, row, Field::INCOME_PER_SHARE, row_number);
    if (!event.dividend_total && !event.dividend_per_share && !event.income_per_share) {
        throw core::MalformedRowError(row_number, "Dist", "dividend carries no distribution amount");
    }

    event.roc_amount = non_negative(columns, row, Field::ROC_AMOUNT, row_number);
    event.taxable_amount = non_negative(columns, row, Field::TAXABLE, row_number);

    const std::string pct_text = columns.cell(row, Field::ROC_PERCENT);
    try {
        event.roc_percent = utils::parse_ratio(pct_text);
    } catch (const std::invalid_argument&) {
        throw core::MalformedRowError(row_number, "RocPct", "cannot parse '" + pct_text + "' as a ratio");
    }
    if (event.roc_percent && (*event.roc_percent < 0.0 || *event.roc_percent > 1.0)) {
        throw core::MalformedRowError(row_number, "RocPct", "ratio '" + pct_text + "' outside [0, 1]");
    }

    // Income per share alone cannot be grossed up when the whole payout is ROC
    const bool from_income_per_share = !event.dividend_total && !event.dividend_per_share;
    if (from_income_per_share && event.roc_percent && *event.roc_percent >= 1.0) {
        throw core::MalformedRowError(row_number, "RocPct",
                                      "income per share needs a return of capital percent below 100%");
    }

    if (event.dividend_total && event.roc_amount && *event.roc_amount > *event.dividend_total) {
        throw core::MalformedRowError(row_number, "ROCAmt", "return of capital exceeds the distribution");
    }
    if (event.dividend_total && event.taxable_amount && *event.taxable_amount > *event.dividend_total) {
        throw core::MalformedRowError(row_number, "Inc", "taxable income exceeds the distribution");
    }

    return event;
}

} // namespace lotbook::ingest
