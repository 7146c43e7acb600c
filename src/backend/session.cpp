/**
 * @file session.cpp
 * @brief Session类的实现文件
 */
#include "session.h"

Session::Session(const std::string& plate, time_t entry)
    : id(0)
    , licensePlate(plate)
    , entryTime(entry)
    , appliedBasePrice(0)   // 分配车位前单价为0
{
}

void Session::assignSpot(const std::string& sector, const std::string& spot,
                         double latitude, double longitude, Cents price) {
    sectorName = sector;
    spotId = spot;
    lat = latitude;
    lng = longitude;
    appliedBasePrice = price;
}

void Session::checkout(time_t exit, Cents fee) {
    // 只有在场的会话才能登记离场，费用只写一次
    if (!exitTime.has_value()) {
        exitTime = exit;
        finalPrice = fee;
    }
}

std::chrono::seconds Session::durationUntil(time_t until) const {
    return std::chrono::seconds(static_cast<long long>(until - entryTime));
}
