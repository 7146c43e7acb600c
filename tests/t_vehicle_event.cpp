// decoding raw webhook fields into typed vehicle events

#include "vehicle_event.h"
#include <cassert>
#include <string>

int main() {
    VehicleEvent event;

    // --- T1: ENTRY ---
    RawVehicleEvent raw;
    raw.licensePlate = "ZUL0001";
    raw.eventType = "ENTRY";
    raw.entryTime = 1735725600;
    assert(decodeVehicleEvent(raw, event) == DecodeStatus::OK);
    const auto* entry = std::get_if<EntryEvent>(&event);
    assert(entry != nullptr);
    assert(entry->licensePlate == "ZUL0001");
    assert(entry->entryTime == 1735725600);
    assert(std::string(eventTypeName(event)) == "ENTRY");
    assert(eventPlate(event) == "ZUL0001");

    // event type is case-insensitive
    raw.eventType = "entry";
    assert(decodeVehicleEvent(raw, event) == DecodeStatus::OK);
    assert(std::holds_alternative<EntryEvent>(event));

    // Given: ENTRY without entry_time
    raw.entryTime.reset();
    assert(decodeVehicleEvent(raw, event) == DecodeStatus::MISSING_ENTRY_TIME);

    // --- T2: PARKED ---
    RawVehicleEvent park;
    park.licensePlate = "ZUL0001";
    park.eventType = "Parked";
    park.lat = -23.561684;
    assert(decodeVehicleEvent(park, event) == DecodeStatus::MISSING_COORDINATES);
    park.lng = -46.655981;
    assert(decodeVehicleEvent(park, event) == DecodeStatus::OK);
    const auto* parked = std::get_if<ParkedEvent>(&event);
    assert(parked != nullptr);
    assert(parked->lat == -23.561684);
    assert(parked->lng == -46.655981);
    assert(std::string(eventTypeName(event)) == "PARKED");

    // --- T3: EXIT ---
    RawVehicleEvent out;
    out.licensePlate = "ZUL0001";
    out.eventType = "EXIT";
    assert(decodeVehicleEvent(out, event) == DecodeStatus::MISSING_EXIT_TIME);
    // fields of other event types are ignored
    out.entryTime = 1;
    out.lat = 1.0;
    out.lng = 2.0;
    assert(decodeVehicleEvent(out, event) == DecodeStatus::MISSING_EXIT_TIME);
    out.exitTime = 1735734600;
    assert(decodeVehicleEvent(out, event) == DecodeStatus::OK);
    assert(std::get<ExitEvent>(event).exitTime == 1735734600);

    // --- T4: rejects ---
    RawVehicleEvent bad = out;
    bad.licensePlate = "";
    assert(decodeVehicleEvent(bad, event) == DecodeStatus::MISSING_PLATE);
    bad.licensePlate = "   ";
    assert(decodeVehicleEvent(bad, event) == DecodeStatus::MISSING_PLATE);

    bad = out;
    bad.eventType = "PAID";
    assert(decodeVehicleEvent(bad, event) == DecodeStatus::UNKNOWN_EVENT_TYPE);
    bad.eventType = "";
    assert(decodeVehicleEvent(bad, event) == DecodeStatus::UNKNOWN_EVENT_TYPE);
    // a rejected decode leaves the previous event alone
    assert(std::holds_alternative<ExitEvent>(event));

    // --- T5: messages ---
    assert(std::string(decodeStatusMessage(DecodeStatus::MISSING_PLATE)) == "license_plate is required");
    assert(std::string(decodeStatusMessage(DecodeStatus::UNKNOWN_EVENT_TYPE)) == "Invalid event_type");

    return 0;
}
