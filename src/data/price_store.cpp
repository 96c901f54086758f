#include "riskdesk/data/price_store.hpp"
#include <algorithm>
#include "riskdesk/core/time_utils.hpp"

namespace riskdesk {

std::vector<DateRange> PriceStore::compute_gaps(const DateRange& range,
                                                const std::vector<CoverageSpan>& spans) {
    std::vector<DateRange> gaps;
    Timestamp cursor = range.start;

    for (const auto& span : spans) {
        if (span.range.end < cursor) {
            continue;
        }
        if (span.range.start > range.end) {
            break;
        }
        if (span.range.start > cursor) {
            gaps.emplace_back(cursor, core::previous_day(span.range.start));
        }
        cursor = std::max(cursor, core::next_day(span.range.end));
        if (cursor > range.end) {
            break;
        }
    }

    if (cursor <= range.end) {
        gaps.emplace_back(cursor, range.end);
    }
    return gaps;
}

SpanUpdate PriceStore::plan_span_update(const std::vector<CoverageSpan>& existing,
                                        const CoverageSpan& incoming) {
    SpanUpdate update;
    for (const auto& span : existing) {
        if (span.symbol != incoming.symbol || !span.range.overlaps(incoming.range)) {
            continue;
        }
        update.superseded.push_back(span);

        // Keep the parts of the older span the new fetch did not cover
        if (span.range.start < incoming.range.start) {
            update.inserted.push_back(
                {span.symbol, DateRange(span.range.start, core::previous_day(incoming.range.start)),
                 span.fetched_at});
        }
        if (span.range.end > incoming.range.end) {
            update.inserted.push_back(
                {span.symbol, DateRange(core::next_day(incoming.range.end), span.range.end),
                 span.fetched_at});
        }
    }
    update.inserted.push_back(incoming);

    std::sort(update.inserted.begin(), update.inserted.end(),
              [](const CoverageSpan& a, const CoverageSpan& b) {
                  return a.range.start < b.range.start;
              });
    return update;
}

Result<StoreRead> PriceStore::get(const std::string& symbol, const DateRange& range) {
    if (!range.is_valid()) {
        return make_error<StoreRead>(ErrorCode::VALIDATION_ERROR, "Invalid range for " + symbol,
                                     "PriceStore");
    }

    auto spans = load_spans(symbol, range);
    if (spans.is_error()) {
        return forward_error<StoreRead>(spans);
    }

    StoreRead read;
    read.spans = spans.value();
    std::sort(read.spans.begin(), read.spans.end(),
              [](const CoverageSpan& a, const CoverageSpan& b) {
                  return a.range.start < b.range.start;
              });
    read.gaps = compute_gaps(range, read.spans);

    read.series.symbol = symbol;
    read.series.range = range;
    for (const auto& span : read.spans) {
        read.series.fetched_at = std::max(read.series.fetched_at, span.fetched_at);
    }

    if (!read.spans.empty()) {
        auto bars = load_bars(symbol, range);
        if (bars.is_error()) {
            return forward_error<StoreRead>(bars);
        }
        read.series.bars = bars.value();
    }
    return Result<StoreRead>(std::move(read));
}

Result<size_t> PriceStore::put(const PriceSeries& series, Timestamp fetched_at) {
    if (!series.range.is_valid()) {
        return make_error<size_t>(ErrorCode::VALIDATION_ERROR,
                                  "Invalid range for " + series.symbol, "PriceStore");
    }

    std::vector<PriceBar> bars;
    bars.reserve(series.bars.size());
    for (const auto& bar : series.bars) {
        if (series.range.contains(bar.date)) {
            bars.push_back(bar);
            bars.back().symbol = series.symbol;
        }
    }

    auto existing = load_spans(series.symbol, series.range);
    if (existing.is_error()) {
        return forward_error<size_t>(existing);
    }

    CoverageSpan incoming{series.symbol, series.range, fetched_at};
    SpanUpdate update = plan_span_update(existing.value(), incoming);
    return write_fetch(series.symbol, bars, update);
}

}  // namespace riskdesk
