/**
 * @file revenue.cpp
 * @brief RevenueAggregator类的实现
 */
#include "revenue.h"
#include "time_utils.h"

RevenueAggregator::RevenueAggregator(const SessionRepository& sessionRepo, Logger& log)
    : sessions(sessionRepo)
    , logger(log) {
}

time_t RevenueAggregator::startOfDay(time_t t) {
    time_t rem = t % SECONDS_PER_DAY;
    if (rem < 0) {
        rem += SECONDS_PER_DAY;
    }
    return t - rem;
}

Cents RevenueAggregator::revenue(const std::string& sector, time_t day) const {
    time_t from = startOfDay(day);
    time_t to = from + SECONDS_PER_DAY - 1;   // 含当天23:59:59

    Cents total = 0;
    for (const auto& session : sessions.findCompletedSessions(sector, from, to)) {
        // 只统计已离场且已计费的会话
        if (session.getExitTime() && session.getFinalPrice()) {
            total += *session.getFinalPrice();
        }
    }

    logger.info("Revenue for sector " + sector + " on " + formatDate(from) +
                ": " + formatCents(total));
    return total;
}
