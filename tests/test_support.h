// shared fixtures for the standalone test programs

#pragma once
#include "event_processor.h"
#include "garage_store.h"
#include "garage_types.h"
#include "logger.h"
#include "repositories.h"
#include "time_utils.h"
#include "vehicle_event.h"
#include <cassert>
#include <sstream>
#include <string>

// UTC timestamp from an ISO-8601 literal; the literal must be valid
inline time_t at(const std::string& iso) {
    time_t t = 0;
    bool ok = parseIso8601(iso, t);
    assert(ok);
    (void)ok;
    return t;
}

// Sector A: base 10.00, capacity 10, spots A01..A10 spaced 0.01 apart
// Sector B: base 12.00, capacity 2,  spots B01..B02
// Sector Z: base 15.00, capacity 1,  spots Z01..Z02 (more spots than capacity)
inline GarageLayout testLayout() {
    GarageLayout layout;
    layout.sectors = {
        {"A", 1000, 10},
        {"B", 1200, 2},
        {"Z", 1500, 1}
    };
    for (int i = 1; i <= 10; ++i) {
        std::string id = i < 10 ? "A0" + std::to_string(i) : "A" + std::to_string(i);
        layout.spots.push_back({id, "A", 10.0 + i * 0.01, 20.0, false});
    }
    for (int i = 1; i <= 2; ++i) {
        layout.spots.push_back({"B0" + std::to_string(i), "B", 30.0 + i * 0.01, 40.0, false});
    }
    for (int i = 1; i <= 2; ++i) {
        layout.spots.push_back({"Z0" + std::to_string(i), "Z", 50.0 + i * 0.01, 60.0, false});
    }
    return layout;
}

// coordinates of spot A<i>
inline double latA(int i) { return 10.0 + i * 0.01; }
inline double lngA() { return 20.0; }

inline RawVehicleEvent entry(const std::string& plate, const std::string& iso) {
    RawVehicleEvent e;
    e.licensePlate = plate;
    e.eventType = "ENTRY";
    e.entryTime = at(iso);
    return e;
}

inline RawVehicleEvent parked(const std::string& plate, double lat, double lng) {
    RawVehicleEvent e;
    e.licensePlate = plate;
    e.eventType = "PARKED";
    e.lat = lat;
    e.lng = lng;
    return e;
}

inline RawVehicleEvent exitAt(const std::string& plate, const std::string& iso) {
    RawVehicleEvent e;
    e.licensePlate = plate;
    e.eventType = "EXIT";
    e.exitTime = at(iso);
    return e;
}

// Session repository whose every call fails as if the database were unreachable
class UnavailableSessionRepository : public SessionRepository {
public:
    std::optional<Session> findActiveSession(const std::string&) const override {
        throw StoreError("session store unavailable");
    }
    Session addSession(const Session&) override {
        throw StoreError("session store unavailable");
    }
    void updateSession(const Session&) override {
        throw StoreError("session store unavailable");
    }
    std::vector<Session> findCompletedSessions(const std::string&, time_t, time_t) const override {
        throw StoreError("session store unavailable");
    }
};

// in-memory garage with the test layout and a captured DEBUG log
struct TestGarage {
    std::ostringstream logs;
    Logger logger{logs, LogLevel::DEBUG};
    GarageStore store;
    EventProcessor processor{store, store, store, logger};

    TestGarage() { store.loadLayout(testLayout()); }

    bool logged(const std::string& text) const {
        return logs.str().find(text) != std::string::npos;
    }
};
