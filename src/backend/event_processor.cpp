/**
 * @file event_processor.cpp
 * @brief EventProcessor类的实现
 */
#include "event_processor.h"
#include "pricing.h"
#include "time_utils.h"
#include <iomanip>
#include <sstream>

const char* eventOutcomeName(EventOutcome outcome) {
    switch (outcome) {
        case EventOutcome::APPLIED: return "applied";
        case EventOutcome::INVALID_EVENT: return "invalid event";
        case EventOutcome::DUPLICATE_ENTRY: return "duplicate entry";
        case EventOutcome::NO_ACTIVE_SESSION: return "no active session";
        case EventOutcome::ALREADY_PARKED: return "already parked";
        case EventOutcome::NO_SPOT_IN_TOLERANCE: return "no spot in tolerance";
        case EventOutcome::UNKNOWN_SECTOR: return "unknown sector";
        case EventOutcome::SECTOR_FULL: return "sector full";
        default: return "unknown";
    }
}

EventProcessor::EventProcessor(SessionRepository& sessionRepo,
                               LayoutRepository& layoutRepo,
                               UnitOfWork& work,
                               Logger& log)
    : sessions(sessionRepo)
    , layout(layoutRepo)
    , unitOfWork(work)
    , logger(log) {
}

bool EventProcessor::processEvent(const RawVehicleEvent& raw) {
    VehicleEvent event;
    DecodeStatus status = decodeVehicleEvent(raw, event);
    if (status != DecodeStatus::OK) {
        logger.warning("Rejected " + raw.eventType + " event for " + raw.licensePlate +
                       ": " + decodeStatusMessage(status));
        return false;
    }
    return processEvent(event);
}

bool EventProcessor::processEvent(const VehicleEvent& event) {
    try {
        return apply(event) == EventOutcome::APPLIED;
    } catch (const std::exception& e) {
        logger.error(std::string("Error processing ") + eventTypeName(event) +
                     " event for " + eventPlate(event) + ": " + e.what());
        return false;
    }
}

EventOutcome EventProcessor::apply(const VehicleEvent& event) {
    // 工作单元在作用域结束时未提交则回滚
    auto unit = unitOfWork.begin();

    EventOutcome outcome = EventOutcome::INVALID_EVENT;
    if (const auto* entry = std::get_if<EntryEvent>(&event)) {
        outcome = applyEntry(*entry);
    } else if (const auto* parked = std::get_if<ParkedEvent>(&event)) {
        outcome = applyParked(*parked);
    } else if (const auto* exit = std::get_if<ExitEvent>(&event)) {
        outcome = applyExit(*exit);
    }

    if (outcome == EventOutcome::APPLIED) {
        unit->commit();
    }
    return outcome;
}

EventOutcome EventProcessor::applyEntry(const EntryEvent& event) {
    if (sessions.findActiveSession(event.licensePlate)) {
        logger.warning("Vehicle " + event.licensePlate + " already has an active session");
        return EventOutcome::DUPLICATE_ENTRY;
    }

    // 车位和单价在PARKED时确定
    Session created = sessions.addSession(Session(event.licensePlate, event.entryTime));

    logger.info("ENTRY processed for " + event.licensePlate + " at " +
                formatIso8601(event.entryTime) + " (session " +
                std::to_string(created.getId()) + ")");
    return EventOutcome::APPLIED;
}

EventOutcome EventProcessor::applyParked(const ParkedEvent& event) {
    // 1. 在场会话
    auto session = sessions.findActiveSession(event.licensePlate);
    if (!session) {
        logger.warning("No active session found for " + event.licensePlate + " on PARKED event");
        return EventOutcome::NO_ACTIVE_SESSION;
    }
    if (session->hasSpot()) {
        logger.warning("Vehicle " + event.licensePlate + " is already parked at spot " +
                       *session->getSpotId());
        return EventOutcome::ALREADY_PARKED;
    }

    // 2. GPS匹配空闲车位
    auto spot = layout.findFreeSpotNear(event.lat, event.lng, GPS_TOLERANCE);
    if (!spot) {
        std::ostringstream msg;
        msg << std::setprecision(9) << "No available spot found for GPS coordinates ("
            << event.lat << ", " << event.lng << ")";
        logger.warning(msg.str());
        return EventOutcome::NO_SPOT_IN_TOLERANCE;
    }

    // 3. 车位所属区域及容量
    auto sector = layout.findSector(spot->sectorName);
    if (!sector) {
        logger.error("Sector " + spot->sectorName + " not found for spot " + spot->spotId);
        return EventOutcome::UNKNOWN_SECTOR;
    }

    std::size_t occupied = layout.countOccupiedSpots(sector->name);
    if (sector->maxCapacity <= 0 || occupied >= static_cast<std::size_t>(sector->maxCapacity)) {
        logger.warning("Sector " + sector->name + " is at full capacity");
        return EventOutcome::SECTOR_FULL;
    }

    // 4. 按分配前的占用率锁定单价
    double rate = occupancyRate(occupied, sector->maxCapacity);
    Cents price = dynamicPrice(sector->basePrice, rate);

    session->assignSpot(sector->name, spot->spotId, event.lat, event.lng, price);
    sessions.updateSession(*session);
    layout.setSpotOccupied(spot->spotId, true);

    std::ostringstream msg;
    msg << "PARKED processed for " << event.licensePlate << " at spot " << spot->spotId
        << " in sector " << sector->name << ", occupancy: "
        << std::fixed << std::setprecision(0) << rate * 100 << "%"
        << ", applied price: " << formatCents(price);
    logger.info(msg.str());
    return EventOutcome::APPLIED;
}

EventOutcome EventProcessor::applyExit(const ExitEvent& event) {
    auto session = sessions.findActiveSession(event.licensePlate);
    if (!session) {
        logger.warning("No active session found for " + event.licensePlate + " on EXIT event");
        return EventOutcome::NO_ACTIVE_SESSION;
    }

    std::chrono::seconds duration = session->durationUntil(event.exitTime);
    if (duration.count() < 0) {
        logger.warning("EXIT time for " + event.licensePlate + " precedes its entry time");
    }

    Cents fee = parkingFee(duration, session->getAppliedBasePrice());
    session->checkout(event.exitTime, fee);
    sessions.updateSession(*session);

    // 释放车位
    if (session->hasSpot()) {
        layout.setSpotOccupied(*session->getSpotId(), false);
    }

    logger.info("EXIT processed for " + event.licensePlate + ", duration: " +
                std::to_string(duration.count() / 60) + " min, fee: " + formatCents(fee));
    return EventOutcome::APPLIED;
}
