#include <lotbook/ledger/distribution_allocator.hpp>
#include <lotbook/utils/logger.hpp>
#include <algorithm>
#include <tuple>

namespace lotbook::ledger {

namespace {

constexpr double kMoneyEpsilon = 1e-9;

} // namespace

DistributionAllocator::DistributionAllocator(core::Weekday week_anchor)
    : week_anchor_(week_anchor) {}

DividendSplit DistributionAllocator::resolve(const core::TransactionEvent& dividend,
                                             double eligible_shares) {
    DividendSplit split;
    if (dividend.dividend_total) {
        split.distribution = *dividend.dividend_total;
    } else if (dividend.dividend_per_share) {
        split.distribution = *dividend.dividend_per_share * eligible_shares;
    } else if (dividend.income_per_share) {
        const double divisor = 1.0 - dividend.roc_percent.value_or(0.0);
        if (divisor > 0.0) {
            split.distribution = *dividend.income_per_share / divisor * eligible_shares;
        }
    }

    if (dividend.roc_amount) {
        split.roc = *dividend.roc_amount;
    } else if (dividend.roc_percent) {
        split.roc = *dividend.roc_percent * split.distribution;
    }

    split.taxable = dividend.taxable_amount ? *dividend.taxable_amount
                                            : split.distribution - split.roc;
    return split;
}

AllocationResult DistributionAllocator::allocate(const std::vector<core::TransactionEvent>& events,
                                                 TrancheBook& book) const {
    std::vector<core::TransactionEvent> dividends;
    for (const auto& event : events) {
        if (event.kind == core::EventKind::DIVIDEND) {
            dividends.push_back(event);
        }
    }
    std::stable_sort(dividends.begin(), dividends.end(), core::chronological);

    AllocationResult result;
    for (const auto& dividend : dividends) {
        allocate_one(dividend, book, result);
        ++result.dividends;
    }

    std::stable_sort(result.rows.begin(), result.rows.end(),
                     [](const AllocationRow& a, const AllocationRow& b) {
                         return std::tie(a.week_start, a.distribution_date, a.lot_id) <
                                std::tie(b.week_start, b.distribution_date, b.lot_id);
                     });

    utils::Logger::info() << "Allocated " << result.dividends << " dividends into "
                          << result.rows.size() << " lot rows, " << result.unallocated.size()
                          << " unallocated" << utils::Logger::endl;
    return result;
}

void DistributionAllocator::allocate_one(const core::TransactionEvent& dividend, TrancheBook& book,
                                         AllocationResult& result) const {
    auto unallocated = [&](const DividendSplit& split, const std::string& reason) {
        utils::Logger::warn() << "Dividend at row " << dividend.row << " ("
                              << dividend.date.to_string() << ") for " << dividend.symbol
                              << " left unallocated: " << reason << utils::Logger::endl;
        result.unallocated.push_back({dividend.row, dividend.date, dividend.symbol,
                                      split.distribution, split.taxable, split.roc, reason});
    };

    if (book.symbol_failed(dividend.symbol)) {
        unallocated(resolve(dividend, 0.0), "symbol ledger failed");
        return;
    }

    std::vector<LotHolding> holdings = book.holdings_as_of(dividend.symbol, dividend.date);
    double eligible = 0.0;
    for (const auto& holding : holdings) {
        eligible += holding.remaining;
    }

    const DividendSplit split = resolve(dividend, eligible);
    if (holdings.empty() || eligible <= 0.0) {
        unallocated(split, "no open lots on distribution date");
        return;
    }
    if (split.roc > split.distribution + kMoneyEpsilon) {
        unallocated(split, "return of capital exceeds the distribution");
        return;
    }
    if (split.taxable > split.distribution + kMoneyEpsilon) {
        unallocated(split, "taxable income exceeds the distribution");
        return;
    }

    const core::Date week = dividend.date.week_start(week_anchor_);
    const double roc_percent = split.distribution > 0.0 ? split.roc / split.distribution : 0.0;

    for (const auto& holding : holdings) {
        Tranche& lot = *holding.lot;
        const double share = holding.remaining / eligible;

        AllocationRow row;
        row.dividend_row = dividend.row;
        row.week_start = week;
        row.distribution_date = dividend.date;
        row.lot_id = lot.id();
        row.symbol = lot.symbol();
        row.cost_basis = lot.cost_basis_as_of(dividend.date);
        row.shares_bought = lot.bought_as_of(dividend.date);
        row.remaining_at_date = holding.remaining;
        row.status_at_date = lot.status_as_of(dividend.date);
        row.dist_per_share = split.distribution / eligible;
        row.income_per_share = split.taxable / eligible;
        row.roc_per_share = split.roc / eligible;
        row.distribution_amount = split.distribution * share;
        row.income_amount = split.taxable * share;
        row.roc_amount = split.roc * share;
        row.roc_percent = roc_percent;

        lot.accrue_distribution(row.income_amount, row.roc_amount);
        result.rows.push_back(row);
    }
}

} // namespace lotbook::ledger
