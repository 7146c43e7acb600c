/**
 * @file vehicle_event.cpp
 * @brief 事件解码实现
 */
#include "vehicle_event.h"
#include <algorithm>
#include <cctype>

namespace {

std::string toUpper(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

DecodeStatus decodeVehicleEvent(const RawVehicleEvent& raw, VehicleEvent& event) {
    if (isBlank(raw.licensePlate)) {
        return DecodeStatus::MISSING_PLATE;
    }

    std::string type = toUpper(raw.eventType);

    if (type == "ENTRY") {
        if (!raw.entryTime) return DecodeStatus::MISSING_ENTRY_TIME;
        event = EntryEvent{raw.licensePlate, *raw.entryTime};
        return DecodeStatus::OK;
    }

    if (type == "PARKED") {
        if (!raw.lat || !raw.lng) return DecodeStatus::MISSING_COORDINATES;
        event = ParkedEvent{raw.licensePlate, *raw.lat, *raw.lng};
        return DecodeStatus::OK;
    }

    if (type == "EXIT") {
        if (!raw.exitTime) return DecodeStatus::MISSING_EXIT_TIME;
        event = ExitEvent{raw.licensePlate, *raw.exitTime};
        return DecodeStatus::OK;
    }

    return DecodeStatus::UNKNOWN_EVENT_TYPE;
}

const char* decodeStatusMessage(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::OK: return "ok";
        case DecodeStatus::MISSING_PLATE: return "license_plate is required";
        case DecodeStatus::UNKNOWN_EVENT_TYPE: return "Invalid event_type";
        case DecodeStatus::MISSING_ENTRY_TIME: return "ENTRY event requires entry_time";
        case DecodeStatus::MISSING_COORDINATES: return "PARKED event requires lat and lng";
        case DecodeStatus::MISSING_EXIT_TIME: return "EXIT event requires exit_time";
        default: return "unknown";
    }
}

const char* eventTypeName(const VehicleEvent& event) {
    switch (event.index()) {
        case 0: return "ENTRY";
        case 1: return "PARKED";
        case 2: return "EXIT";
        default: return "UNKNOWN";
    }
}

const std::string& eventPlate(const VehicleEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.licensePlate; }, event);
}
