/**
 * @file garage_store.cpp
 * @brief GarageStore类的线程安全实现
 */
#include "garage_store.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>

namespace {

const std::uint32_t DATA_FILE_MAGIC = 0x4B524147;   // "GARK"
const std::uint32_t DATA_FILE_VERSION = 1;
const std::uint64_t MAX_STRING_LENGTH = 4096;

// 会话可选字段的存在标志
enum SessionFlags : std::uint8_t {
    HAS_EXIT_TIME   = 1 << 0,
    HAS_SECTOR      = 1 << 1,
    HAS_SPOT        = 1 << 2,
    HAS_LAT         = 1 << 3,
    HAS_LNG         = 1 << 4,
    HAS_FINAL_PRICE = 1 << 5
};

template <typename T>
void writeValue(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
bool readValue(std::ifstream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return static_cast<bool>(in);
}

void writeString(std::ofstream& out, const std::string& value) {
    std::uint64_t length = value.length();
    writeValue(out, length);
    out.write(value.c_str(), static_cast<std::streamsize>(length));
}

bool readString(std::ifstream& in, std::string& value) {
    std::uint64_t length = 0;
    if (!readValue(in, length) || length > MAX_STRING_LENGTH) {
        return false;
    }
    value.assign(length, '\0');
    in.read(&value[0], static_cast<std::streamsize>(length));
    return static_cast<bool>(in);
}

}  // namespace

/**
 * @brief 工作单元：持有unitMutex直到析构
 */
class GarageStore::StoreTransaction : public Transaction {
public:
    explicit StoreTransaction(GarageStore& s)
        : store(s)
        , lock(s.unitMutex)
        , committed(false) {
        store.undoLog.clear();
        store.unitOwner = std::this_thread::get_id();
    }

    ~StoreTransaction() override {
        if (!committed) {
            store.rollbackTransaction();
        }
    }

    void commit() override {
        store.commitTransaction();
        committed = true;
    }

private:
    GarageStore& store;
    std::unique_lock<std::mutex> lock;
    bool committed;
};

GarageStore::GarageStore(const std::string& filePath)
    : nextSessionId(1)
    , dataFilePath(filePath)
    , unitOwner(std::thread::id()) {
    if (!dataFilePath.empty()) {
        loadData();
    }
}

std::unique_ptr<Transaction> GarageStore::begin() {
    return std::make_unique<StoreTransaction>(*this);
}

bool GarageStore::inOwnTransaction() const {
    return unitOwner.load() == std::this_thread::get_id();
}

std::unique_lock<std::mutex> GarageStore::waitForCommittedState() const {
    std::unique_lock<std::mutex> unitLock(unitMutex, std::defer_lock);
    // 工作单元内部的调用看到自己的修改
    if (!inOwnTransaction()) {
        unitLock.lock();
    }
    return unitLock;
}

void GarageStore::recordChange(std::function<void()> undo) {
    if (inOwnTransaction()) {
        undoLog.push_back(std::move(undo));
        return;
    }

    // 工作单元之外的写操作：立即保存，失败则撤销
    if (!saveData()) {
        std::unique_lock<std::shared_mutex> lock(mutex);
        undo();
        throw StoreError("Failed to write data file: " + dataFilePath);
    }
}

void GarageStore::persistOrThrow() const {
    if (!saveData()) {
        throw StoreError("Failed to write data file: " + dataFilePath);
    }
}

void GarageStore::commitTransaction() {
    // 持久化失败时撤销日志保留，由析构回滚
    persistOrThrow();
    undoLog.clear();
    unitOwner = std::thread::id();
}

void GarageStore::rollbackTransaction() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        for (auto it = undoLog.rbegin(); it != undoLog.rend(); ++it) {
            (*it)();
        }
    }
    undoLog.clear();
    unitOwner = std::thread::id();
}

std::optional<Session> GarageStore::findActiveSession(const std::string& plate) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto it = activeIndex.find(plate);
    if (it == activeIndex.end()) {
        return std::nullopt;
    }
    return sessions[it->second];
}

Session GarageStore::addSession(const Session& session) {
    Session stored = session;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);

        stored.setId(nextSessionId++);
        sessions.push_back(stored);
        if (stored.isActive()) {
            activeIndex[stored.getLicensePlate()] = sessions.size() - 1;
        }
    }

    std::string plate = stored.getLicensePlate();
    bool wasActive = stored.isActive();
    recordChange([this, plate, wasActive]() {
        sessions.pop_back();
        if (wasActive) {
            activeIndex.erase(plate);
        }
        --nextSessionId;
    });
    return stored;
}

void GarageStore::updateSession(const Session& session) {
    Session previous;
    size_t index = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);

        // 会话编号从1开始连续分配
        if (session.getId() <= 0 || static_cast<size_t>(session.getId()) > sessions.size() ||
            sessions[session.getId() - 1].getId() != session.getId()) {
            throw StoreError("Unknown session id: " + std::to_string(session.getId()));
        }

        index = static_cast<size_t>(session.getId() - 1);
        previous = sessions[index];
        sessions[index] = session;

        if (previous.isActive()) {
            activeIndex.erase(previous.getLicensePlate());
        }
        if (session.isActive()) {
            activeIndex[session.getLicensePlate()] = index;
        }
    }

    recordChange([this, previous, index]() {
        const Session& current = sessions[index];
        if (current.isActive()) {
            activeIndex.erase(current.getLicensePlate());
        }
        sessions[index] = previous;
        if (previous.isActive()) {
            activeIndex[previous.getLicensePlate()] = index;
        }
    });
}

std::vector<Session> GarageStore::findCompletedSessions(const std::string& sector,
                                                        time_t from, time_t to) const {
    auto unitLock = waitForCommittedState();
    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<Session> result;
    for (const auto& session : sessions) {
        const auto& exit = session.getExitTime();
        if (!exit.has_value() || !session.getFinalPrice().has_value()) {
            continue;
        }
        if (session.getSectorName() != sector) {
            continue;
        }
        if (*exit >= from && *exit <= to) {
            result.push_back(session);
        }
    }
    return result;
}

bool GarageStore::hasLayout() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return !sectors.empty();
}

void GarageStore::loadLayout(const GarageLayout& layout) {
    std::vector<Sector> oldSectors;
    std::vector<Spot> oldSpots;
    std::map<std::string, size_t> oldIndex;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);

        oldSectors.swap(sectors);
        oldSpots.swap(spots);
        oldIndex.swap(spotIndex);

        sectors = layout.sectors;
        spots = layout.spots;
        for (size_t i = 0; i < spots.size(); ++i) {
            spotIndex[spots[i].spotId] = i;
        }
    }

    recordChange([this, oldSectors, oldSpots, oldIndex]() {
        sectors = oldSectors;
        spots = oldSpots;
        spotIndex = oldIndex;
    });
}

std::optional<Sector> GarageStore::findSector(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto it = std::find_if(sectors.begin(), sectors.end(),
                           [&name](const Sector& s) { return s.name == name; });
    if (it == sectors.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<Spot> GarageStore::findFreeSpotNear(double lat, double lng, double tolerance) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    // 线性扫描，布局顺序中第一个满足条件的车位胜出
    for (const auto& spot : spots) {
        if (!spot.occupied &&
            std::fabs(spot.lat - lat) < tolerance &&
            std::fabs(spot.lng - lng) < tolerance) {
            return spot;
        }
    }
    return std::nullopt;
}

std::size_t GarageStore::countOccupiedSpots(const std::string& sector) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    return static_cast<std::size_t>(std::count_if(spots.begin(), spots.end(),
        [&sector](const Spot& s) { return s.sectorName == sector && s.occupied; }));
}

void GarageStore::setSpotOccupied(const std::string& spotId, bool occupied) {
    size_t index = 0;
    bool previous = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);

        auto it = spotIndex.find(spotId);
        if (it == spotIndex.end()) {
            throw StoreError("Unknown spot: " + spotId);
        }
        index = it->second;
        previous = spots[index].occupied;
        spots[index].occupied = occupied;
    }

    recordChange([this, index, previous]() {
        spots[index].occupied = previous;
    });
}

std::vector<SectorStatus> GarageStore::getSectorStatus() const {
    auto unitLock = waitForCommittedState();
    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<SectorStatus> result;
    result.reserve(sectors.size());
    for (const auto& sector : sectors) {
        SectorStatus status;
        status.sector = sector;
        status.occupied = static_cast<std::size_t>(std::count_if(spots.begin(), spots.end(),
            [&sector](const Spot& s) { return s.sectorName == sector.name && s.occupied; }));
        result.push_back(status);
    }
    return result;
}

std::vector<Session> GarageStore::getAllSessions() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return sessions;
}

std::vector<Spot> GarageStore::getSpots() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return spots;
}

bool GarageStore::saveData() const {
    if (dataFilePath.empty()) {
        return true;
    }

    // 1. 获取读锁，因为我们只需要读取数据来保存
    std::shared_lock<std::shared_mutex> dataLock(mutex);

    // 2. 获取文件锁，保护文件操作
    std::lock_guard<std::mutex> fileLock(fileMutex);

    // 先写临时文件，完整写入后再替换，失败时原文件保持不变
    const std::string tmpPath = dataFilePath + ".tmp";
    std::ofstream outFile(tmpPath, std::ios::binary | std::ios::trunc);
    if (!outFile) return false;

    writeValue(outFile, DATA_FILE_MAGIC);
    writeValue(outFile, DATA_FILE_VERSION);

    // 3. 写入区域
    std::uint64_t sectorCount = sectors.size();
    writeValue(outFile, sectorCount);
    for (const auto& sector : sectors) {
        writeString(outFile, sector.name);
        std::int64_t basePrice = sector.basePrice;
        std::int32_t capacity = sector.maxCapacity;
        writeValue(outFile, basePrice);
        writeValue(outFile, capacity);
    }

    // 4. 写入车位
    std::uint64_t spotCount = spots.size();
    writeValue(outFile, spotCount);
    for (const auto& spot : spots) {
        writeString(outFile, spot.spotId);
        writeString(outFile, spot.sectorName);
        writeValue(outFile, spot.lat);
        writeValue(outFile, spot.lng);
        std::uint8_t occupied = spot.occupied ? 1 : 0;
        writeValue(outFile, occupied);
    }

    // 5. 写入会话
    std::int64_t nextId = nextSessionId;
    writeValue(outFile, nextId);
    std::uint64_t sessionCount = sessions.size();
    writeValue(outFile, sessionCount);
    for (const auto& session : sessions) {
        std::int64_t id = session.getId();
        std::int64_t entryTime = session.getEntryTime();
        std::int64_t appliedPrice = session.getAppliedBasePrice();
        writeValue(outFile, id);
        writeString(outFile, session.getLicensePlate());
        writeValue(outFile, entryTime);
        writeValue(outFile, appliedPrice);

        std::uint8_t flags = 0;
        if (session.getExitTime()) flags |= HAS_EXIT_TIME;
        if (session.getSectorName()) flags |= HAS_SECTOR;
        if (session.getSpotId()) flags |= HAS_SPOT;
        if (session.getLat()) flags |= HAS_LAT;
        if (session.getLng()) flags |= HAS_LNG;
        if (session.getFinalPrice()) flags |= HAS_FINAL_PRICE;
        writeValue(outFile, flags);

        if (session.getExitTime()) writeValue(outFile, static_cast<std::int64_t>(*session.getExitTime()));
        if (session.getSectorName()) writeString(outFile, *session.getSectorName());
        if (session.getSpotId()) writeString(outFile, *session.getSpotId());
        if (session.getLat()) writeValue(outFile, *session.getLat());
        if (session.getLng()) writeValue(outFile, *session.getLng());
        if (session.getFinalPrice()) writeValue(outFile, static_cast<std::int64_t>(*session.getFinalPrice()));
    }

    outFile.flush();
    outFile.close();
    if (!outFile) {
        std::remove(tmpPath.c_str());
        return false;
    }

    // 6. 原子替换数据文件
    if (std::rename(tmpPath.c_str(), dataFilePath.c_str()) != 0) {
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

bool GarageStore::loadData() {
    std::vector<Sector> loadedSectors;
    std::vector<Spot> loadedSpots;
    std::vector<Session> loadedSessions;
    std::int64_t loadedNextId = 1;

    {
        // 1. 获取文件锁
        std::lock_guard<std::mutex> fileLock(fileMutex);

        std::ifstream inFile(dataFilePath, std::ios::binary);
        if (!inFile) return false;

        const std::string corrupt = "Corrupt data file: " + dataFilePath;

        std::uint32_t magic = 0;
        std::uint32_t version = 0;
        if (!readValue(inFile, magic) || magic != DATA_FILE_MAGIC ||
            !readValue(inFile, version) || version != DATA_FILE_VERSION) {
            throw StoreError(corrupt);
        }

        // 2. 读取区域
        std::uint64_t sectorCount = 0;
        if (!readValue(inFile, sectorCount)) throw StoreError(corrupt);
        for (std::uint64_t i = 0; i < sectorCount; ++i) {
            Sector sector;
            std::int64_t basePrice = 0;
            std::int32_t capacity = 0;
            if (!readString(inFile, sector.name) ||
                !readValue(inFile, basePrice) ||
                !readValue(inFile, capacity)) {
                throw StoreError(corrupt);
            }
            sector.basePrice = basePrice;
            sector.maxCapacity = capacity;
            loadedSectors.push_back(sector);
        }

        // 3. 读取车位
        std::uint64_t spotCount = 0;
        if (!readValue(inFile, spotCount)) throw StoreError(corrupt);
        for (std::uint64_t i = 0; i < spotCount; ++i) {
            Spot spot;
            std::uint8_t occupied = 0;
            if (!readString(inFile, spot.spotId) ||
                !readString(inFile, spot.sectorName) ||
                !readValue(inFile, spot.lat) ||
                !readValue(inFile, spot.lng) ||
                !readValue(inFile, occupied)) {
                throw StoreError(corrupt);
            }
            spot.occupied = occupied != 0;
            loadedSpots.push_back(spot);
        }

        // 4. 读取会话
        std::uint64_t sessionCount = 0;
        if (!readValue(inFile, loadedNextId) || !readValue(inFile, sessionCount)) {
            throw StoreError(corrupt);
        }
        for (std::uint64_t i = 0; i < sessionCount; ++i) {
            std::int64_t id = 0;
            std::string plate;
            std::int64_t entryTime = 0;
            std::int64_t appliedPrice = 0;
            std::uint8_t flags = 0;
            if (!readValue(inFile, id) ||
                !readString(inFile, plate) ||
                !readValue(inFile, entryTime) ||
                !readValue(inFile, appliedPrice) ||
                !readValue(inFile, flags)) {
                throw StoreError(corrupt);
            }

            Session session(plate, static_cast<time_t>(entryTime));
            session.setId(id);
            session.setAppliedBasePrice(appliedPrice);

            std::int64_t exitTime = 0;
            std::int64_t finalPrice = 0;
            std::string sectorName;
            std::string spotId;
            double lat = 0.0;
            double lng = 0.0;
            if ((flags & HAS_EXIT_TIME) && !readValue(inFile, exitTime)) throw StoreError(corrupt);
            if ((flags & HAS_SECTOR) && !readString(inFile, sectorName)) throw StoreError(corrupt);
            if ((flags & HAS_SPOT) && !readString(inFile, spotId)) throw StoreError(corrupt);
            if ((flags & HAS_LAT) && !readValue(inFile, lat)) throw StoreError(corrupt);
            if ((flags & HAS_LNG) && !readValue(inFile, lng)) throw StoreError(corrupt);
            if ((flags & HAS_FINAL_PRICE) && !readValue(inFile, finalPrice)) throw StoreError(corrupt);

            if (flags & HAS_SPOT) {
                session.assignSpot(sectorName, spotId, lat, lng, appliedPrice);
            }
            if (flags & HAS_EXIT_TIME) session.setExitTime(static_cast<time_t>(exitTime));
            if (flags & HAS_FINAL_PRICE) session.setFinalPrice(finalPrice);

            if (session.getId() != static_cast<long long>(loadedSessions.size() + 1)) {
                throw StoreError(corrupt);
            }
            loadedSessions.push_back(session);
        }
    }

    // 5. 获取写锁，替换全部数据
    std::unique_lock<std::shared_mutex> dataLock(mutex);

    sectors.swap(loadedSectors);
    spots.swap(loadedSpots);
    sessions.swap(loadedSessions);
    nextSessionId = loadedNextId;

    spotIndex.clear();
    for (size_t i = 0; i < spots.size(); ++i) {
        spotIndex[spots[i].spotId] = i;
    }
    activeIndex.clear();
    for (size_t i = 0; i < sessions.size(); ++i) {
        if (sessions[i].isActive()) {
            activeIndex[sessions[i].getLicensePlate()] = i;
        }
    }

    return true;
}
