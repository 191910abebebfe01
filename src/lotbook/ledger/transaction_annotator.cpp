#include <lotbook/ledger/transaction_annotator.hpp>
#include <lotbook/ledger/distribution_allocator.hpp>
#include <algorithm>
#include <map>
#include <numeric>

namespace lotbook::ledger {

std::vector<AnnotatedTransaction> annotate_transactions(const std::vector<core::TransactionEvent>& events,
                                                        const TrancheBook& book,
                                                        core::Weekday week_anchor) {
    std::vector<size_t> order(events.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&events](size_t a, size_t b) {
        return core::chronological(events[a], events[b]);
    });

    std::vector<AnnotatedTransaction> out(events.size());
    std::map<std::string, double> running;

    for (size_t index : order) {
        const core::TransactionEvent& event = events[index];
        AnnotatedTransaction& note = out[index];
        note.row = event.row;
        note.kind = event.kind;
        note.date = event.date;
        note.week_start = event.date.week_start(week_anchor);
        note.symbol = event.symbol;
        note.shares = event.shares;
        note.price = event.price;

        double& held = running[event.symbol];
        switch (event.kind) {
            case core::EventKind::BUY:
                held += event.shares;
                note.cost = event.total_value();
                break;
            case core::EventKind::SELL:
                held -= event.shares;
                break;
            case core::EventKind::DIVIDEND:
                break;
        }
        note.running_shares = held;

        if (event.kind == core::EventKind::DIVIDEND) {
            const DividendSplit split = DistributionAllocator::resolve(event, held);
            note.distribution = split.distribution;
            note.taxable = split.taxable;
            note.roc = split.roc;
            note.dist_per_share = held > 0.0 ? split.distribution / held : 0.0;
            note.income_per_share = held > 0.0 ? split.taxable / held : 0.0;
            note.roc_per_share = held > 0.0 ? split.roc / held : 0.0;
            continue;
        }

        note.lot_id = book.lot_for_row(event.row);
        if (const Tranche* lot = book.find(note.lot_id)) {
            note.lot_remaining = lot->remaining_as_of(event.date);
            note.lot_status = lot->status_as_of(event.date);
        }
    }

    return out;
}

} // namespace lotbook::ledger
