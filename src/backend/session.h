/**
 * @file session.h
 * @brief 停车会话类的声明
 */
#pragma once
#include "pricing.h"
#include <chrono>
#include <ctime>
#include <optional>
#include <string>

/**
 * @class Session
 * @brief 一辆车从入场到离场的完整记录
 *
 * 会话在ENTRY时创建，PARKED时写入车位与锁定单价，EXIT时写入离场时间与费用。
 * 会话永不删除，已完成的会话用于营收统计。
 */
class Session {
private:
    long long id;                           // 存储分配的会话编号
    std::string licensePlate;               // 车牌号
    time_t entryTime;                       // 入场时间（UTC）
    std::optional<time_t> exitTime;         // 离场时间，未离场时为空
    std::optional<std::string> sectorName;  // 所在区域
    std::optional<std::string> spotId;      // 所在车位
    std::optional<double> lat;
    std::optional<double> lng;
    Cents appliedBasePrice;                 // 入位时锁定的小时单价，入位前为0
    std::optional<Cents> finalPrice;        // 离场费用

public:
    Session() : id(0), entryTime(0), appliedBasePrice(0) {}

    /**
     * @brief 创建新的在场会话
     * @param plate 车牌号
     * @param entry 入场时间
     */
    Session(const std::string& plate, time_t entry);

    long long getId() const { return id; }
    const std::string& getLicensePlate() const { return licensePlate; }
    time_t getEntryTime() const { return entryTime; }
    const std::optional<time_t>& getExitTime() const { return exitTime; }
    const std::optional<std::string>& getSectorName() const { return sectorName; }
    const std::optional<std::string>& getSpotId() const { return spotId; }
    const std::optional<double>& getLat() const { return lat; }
    const std::optional<double>& getLng() const { return lng; }
    Cents getAppliedBasePrice() const { return appliedBasePrice; }
    const std::optional<Cents>& getFinalPrice() const { return finalPrice; }

    /**
     * @brief 是否仍在场（没有离场时间）
     */
    bool isActive() const { return !exitTime.has_value(); }

    /**
     * @brief 是否已分配车位
     */
    bool hasSpot() const { return spotId.has_value() && !spotId->empty(); }

    /**
     * @brief 记录车位分配
     * @param sector 车位所在区域
     * @param spot 车位编号
     * @param latitude 事件上报的纬度
     * @param longitude 事件上报的经度
     * @param price 按当前占用率计算出的小时单价
     */
    void assignSpot(const std::string& sector, const std::string& spot,
                    double latitude, double longitude, Cents price);

    /**
     * @brief 登记离场
     * @param exit 离场时间
     * @param fee 最终费用
     */
    void checkout(time_t exit, Cents fee);

    /**
     * @brief 从入场到给定时间的停车时长
     */
    std::chrono::seconds durationUntil(time_t until) const;

    // 以下仅用于从数据文件还原历史记录
    void setId(long long newId) { id = newId; }
    void setExitTime(time_t time) { exitTime = time; }
    void setFinalPrice(Cents price) { finalPrice = price; }
    void setAppliedBasePrice(Cents price) { appliedBasePrice = price; }
};
