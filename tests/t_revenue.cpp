// daily revenue per sector over completed sessions

#include "revenue.h"
#include "test_support.h"
#include <cassert>

int main() {
    const time_t jan1 = at("2025-01-01T00:00:00Z");

    // --- T1: completed sessions count, active ones do not ---
    {
        TestGarage g;
        RevenueAggregator revenue(g.store, g.logger);
        // Given: one finished stay of 18.00 and one vehicle still parked
        assert(g.processor.processEvent(entry("ABC1234", "2025-01-01T10:00:00Z")));
        assert(g.processor.processEvent(parked("ABC1234", latA(1), lngA())));
        assert(g.processor.processEvent(exitAt("ABC1234", "2025-01-01T12:30:00Z")));
        assert(g.processor.processEvent(entry("XYZ9876", "2025-01-01T11:00:00Z")));
        assert(g.processor.processEvent(parked("XYZ9876", latA(2), lngA())));
        // Then
        assert(revenue.revenue("A", jan1) == 1800);
        // any instant of the day selects the same window
        assert(revenue.revenue("A", at("2025-01-01T17:45:00Z")) == 1800);
        assert(g.logged("Revenue for sector A on 2025-01-01: 18.00"));

        // other sectors, other days and unknown sectors are zero
        assert(revenue.revenue("B", jan1) == 0);
        assert(revenue.revenue("a", jan1) == 0);
        assert(revenue.revenue("NOPE", jan1) == 0);
        assert(revenue.revenue("A", jan1 + SECONDS_PER_DAY) == 0);

        // When: the second vehicle leaves the next day
        assert(g.processor.processEvent(exitAt("XYZ9876", "2025-01-02T01:00:00Z")));
        // Then: it is booked on the exit day, not the entry day
        assert(revenue.revenue("A", jan1) == 1800);
        // 14 hours, 30 free, 14 billable at 9.00
        assert(revenue.revenue("A", jan1 + SECONDS_PER_DAY) == 12600);
    }

    // --- T2: day boundaries are inclusive of 23:59:59 ---
    {
        TestGarage g;
        RevenueAggregator revenue(g.store, g.logger);
        assert(g.processor.processEvent(entry("LATE001", "2025-01-01T22:00:00Z")));
        assert(g.processor.processEvent(parked("LATE001", latA(1), lngA())));
        assert(g.processor.processEvent(exitAt("LATE001", "2025-01-01T23:59:59Z")));
        assert(g.processor.processEvent(entry("EDGE001", "2025-01-01T22:00:00Z")));
        assert(g.processor.processEvent(parked("EDGE001", latA(2), lngA())));
        assert(g.processor.processEvent(exitAt("EDGE001", "2025-01-02T00:00:00Z")));
        // LATE001: 119m59s -> 2h at 9.00, EDGE001: 120m -> 2h at 9.00
        assert(revenue.revenue("A", jan1) == 1800);
        assert(revenue.revenue("A", jan1 + SECONDS_PER_DAY) == 1800);
    }

    // --- T3: several sectors on the same day ---
    {
        TestGarage g;
        RevenueAggregator revenue(g.store, g.logger);
        assert(g.processor.processEvent(entry("AAA0001", "2025-01-01T08:00:00Z")));
        assert(g.processor.processEvent(parked("AAA0001", latA(1), lngA())));
        assert(g.processor.processEvent(entry("BBB0001", "2025-01-01T08:00:00Z")));
        assert(g.processor.processEvent(parked("BBB0001", 30.01, 40.0)));
        assert(g.processor.processEvent(exitAt("AAA0001", "2025-01-01T09:00:00Z")));
        assert(g.processor.processEvent(exitAt("BBB0001", "2025-01-01T09:00:00Z")));
        // one billable hour each: 9.00 in A, 10.80 in B
        assert(revenue.revenue("A", jan1) == 900);
        assert(revenue.revenue("B", jan1) == 1080);
    }

    // --- T4: start of day ---
    assert(RevenueAggregator::startOfDay(jan1) == jan1);
    assert(RevenueAggregator::startOfDay(jan1 + 12345) == jan1);
    assert(RevenueAggregator::startOfDay(-1) == -SECONDS_PER_DAY);

    // --- T5: store failures propagate ---
    {
        std::ostringstream logs;
        Logger logger(logs);
        UnavailableSessionRepository sessions;
        RevenueAggregator revenue(sessions, logger);
        bool threw = false;
        try {
            revenue.revenue("A", jan1);
        } catch (const StoreError&) {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
