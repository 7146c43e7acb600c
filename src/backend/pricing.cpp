/**
 * @file pricing.cpp
 * @brief 定价函数实现
 */
#include "pricing.h"
#include <cmath>
#include <iomanip>
#include <sstream>

double occupancyRate(std::size_t occupied, int capacity) {
    if (capacity <= 0) {
        return occupied > 0 ? 1.0 : 0.0;
    }
    return static_cast<double>(occupied) / capacity;
}

int priceMultiplierPercent(double rate) {
    if (rate < 0.25) return 90;    // 9折
    if (rate < 0.50) return 100;
    if (rate < 0.75) return 110;   // 上浮10%
    return 125;                    // 上浮25%
}

Cents dynamicPrice(Cents basePrice, double rate) {
    Cents scaled = basePrice * priceMultiplierPercent(rate);
    // 四舍五入到分（远离零）
    Cents half = scaled >= 0 ? 50 : -50;
    return (scaled + half) / 100;
}

long long billableHours(std::chrono::seconds duration) {
    const long long grace = GRACE_PERIOD_MINUTES * 60LL;
    long long total = duration.count();
    if (total <= grace) {
        return 0;
    }
    long long chargeable = total - grace;
    return (chargeable + 3599) / 3600;
}

Cents parkingFee(std::chrono::seconds duration, Cents appliedBasePrice) {
    return billableHours(duration) * appliedBasePrice;
}

Cents toCents(double amount) {
    return static_cast<Cents>(std::llround(amount * 100.0));
}

double toAmount(Cents cents) {
    return static_cast<double>(cents) / 100.0;
}

std::string formatCents(Cents cents) {
    std::ostringstream out;
    if (cents < 0) {
        out << '-';
        cents = -cents;
    }
    out << cents / 100 << '.' << std::setw(2) << std::setfill('0') << cents % 100;
    return out.str();
}
