/**
 * @file repositories.h
 * @brief 事件处理器依赖的存储接口
 *
 * 事件处理器只依赖这些窄接口，而不是具体的存储实现：
 * - SessionRepository：会话查询与写入
 * - LayoutRepository：区域与车位查询、车位占用切换
 * - UnitOfWork：把一次事件的读-改-写序列包成原子操作
 */
#pragma once
#include "garage_types.h"
#include "session.h"
#include <ctime>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief 存储不可用或拒绝写入
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    /**
     * @brief 查找车牌号对应的在场会话
     */
    virtual std::optional<Session> findActiveSession(const std::string& plate) const = 0;

    /**
     * @brief 新增会话
     * @return 带有存储分配编号的会话
     */
    virtual Session addSession(const Session& session) = 0;

    /**
     * @brief 按编号覆盖会话
     * @throws StoreError 编号不存在
     */
    virtual void updateSession(const Session& session) = 0;

    /**
     * @brief 查询某区域在[from, to]内离场且已计费的会话
     */
    virtual std::vector<Session> findCompletedSessions(const std::string& sector,
                                                       time_t from, time_t to) const = 0;
};

class LayoutRepository {
public:
    virtual ~LayoutRepository() = default;

    virtual bool hasLayout() const = 0;
    virtual void loadLayout(const GarageLayout& layout) = 0;

    virtual std::optional<Sector> findSector(const std::string& name) const = 0;

    /**
     * @brief 按布局顺序查找第一个在GPS容差内的空闲车位
     * @param tolerance 经纬度各自允许的最大偏差（严格小于）
     */
    virtual std::optional<Spot> findFreeSpotNear(double lat, double lng, double tolerance) const = 0;

    virtual std::size_t countOccupiedSpots(const std::string& sector) const = 0;

    /**
     * @throws StoreError 车位不存在
     */
    virtual void setSpotOccupied(const std::string& spotId, bool occupied) = 0;

    virtual std::vector<SectorStatus> getSectorStatus() const = 0;
};

/**
 * @brief 一次工作单元；析构时若未提交则回滚
 */
class Transaction {
public:
    virtual ~Transaction() = default;

    /**
     * @throws StoreError 持久化失败（此时析构会回滚内存中的修改）
     */
    virtual void commit() = 0;
};

class UnitOfWork {
public:
    virtual ~UnitOfWork() = default;

    /**
     * @brief 开始工作单元，持有期间其它工作单元被阻塞
     */
    virtual std::unique_ptr<Transaction> begin() = 0;
};
