/**
 * @file vehicle_event.h
 * @brief 车辆生命周期事件
 *
 * RawVehicleEvent是传输层收到的原始事件（类型字符串 + 可选字段），
 * VehicleEvent是解码后的事件，三种类型各自只携带需要的字段。
 */
#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <variant>

/**
 * @brief 传输层收到的原始事件
 */
struct RawVehicleEvent {
    std::string licensePlate;
    std::string eventType;              // "ENTRY" / "PARKED" / "EXIT"
    std::optional<time_t> entryTime;
    std::optional<time_t> exitTime;
    std::optional<double> lat;
    std::optional<double> lng;
};

struct EntryEvent {
    std::string licensePlate;
    time_t entryTime;
};

struct ParkedEvent {
    std::string licensePlate;
    double lat;
    double lng;
};

struct ExitEvent {
    std::string licensePlate;
    time_t exitTime;
};

using VehicleEvent = std::variant<EntryEvent, ParkedEvent, ExitEvent>;

/**
 * @brief 原始事件的解码结果
 */
enum class DecodeStatus {
    OK,
    MISSING_PLATE,
    UNKNOWN_EVENT_TYPE,
    MISSING_ENTRY_TIME,
    MISSING_COORDINATES,
    MISSING_EXIT_TIME
};

/**
 * @brief 把原始事件解码为带类型的事件
 * @param raw 原始事件，类型字符串不区分大小写
 * @param[out] event 解码成功时写入
 * @return 解码状态，非OK时event不变
 */
DecodeStatus decodeVehicleEvent(const RawVehicleEvent& raw, VehicleEvent& event);

const char* decodeStatusMessage(DecodeStatus status);

/**
 * @brief 事件类型名称，用于日志
 */
const char* eventTypeName(const VehicleEvent& event);

const std::string& eventPlate(const VehicleEvent& event);
