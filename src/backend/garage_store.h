/**
 * @file garage_store.h
 * @brief 车库存储 - 线程安全实现
 */
#pragma once
#include "repositories.h"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @class GarageStore
 * @brief 内存存储，可选地把快照持久化到二进制数据文件
 *
 * 并发安全保证：
 * 1. 读写锁(shared_mutex)保护区域、车位、会话数据，查询使用读锁
 * 2. 工作单元互斥锁串行化所有事件处理，保证"每个车牌最多一个在场会话"
 *    和"每个车位最多一个会话"在并发调用下成立
 * 3. 工作单元内的修改记录在撤销日志中，未提交时按逆序撤销
 * 4. 文件互斥锁保护数据文件读写
 *
 * dataFilePath为空时只在内存中保存。
 */
class GarageStore : public SessionRepository,
                    public LayoutRepository,
                    public UnitOfWork {
public:
    /**
     * @brief 构造函数，存在数据文件时立即加载
     * @param filePath 数据文件路径，空串表示不持久化
     * @throws StoreError 数据文件损坏
     */
    explicit GarageStore(const std::string& filePath = "");

    // 禁止拷贝构造和赋值，避免并发安全问题
    GarageStore(const GarageStore&) = delete;
    GarageStore& operator=(const GarageStore&) = delete;

    // SessionRepository
    std::optional<Session> findActiveSession(const std::string& plate) const override;
    Session addSession(const Session& session) override;
    void updateSession(const Session& session) override;
    std::vector<Session> findCompletedSessions(const std::string& sector,
                                               time_t from, time_t to) const override;

    // LayoutRepository
    bool hasLayout() const override;
    void loadLayout(const GarageLayout& layout) override;
    std::optional<Sector> findSector(const std::string& name) const override;
    std::optional<Spot> findFreeSpotNear(double lat, double lng, double tolerance) const override;
    std::size_t countOccupiedSpots(const std::string& sector) const override;
    void setSpotOccupied(const std::string& spotId, bool occupied) override;
    std::vector<SectorStatus> getSectorStatus() const override;

    // UnitOfWork
    std::unique_ptr<Transaction> begin() override;

    /**
     * @brief 保存快照到数据文件
     * @return 是否成功保存（未配置数据文件时直接返回true）
     */
    bool saveData() const;

    /**
     * @brief 从数据文件加载快照
     * @return 文件不存在时返回false
     * @throws StoreError 文件内容损坏
     */
    bool loadData();

    std::vector<Session> getAllSessions() const;
    std::vector<Spot> getSpots() const;

private:
    class StoreTransaction;

    // 写操作释放数据锁后调用：工作单元内记录撤销动作，否则立即持久化
    void recordChange(std::function<void()> undo);
    bool inOwnTransaction() const;
    // 汇总查询等待进行中的工作单元结束，只读到已提交的数据
    std::unique_lock<std::mutex> waitForCommittedState() const;
    void commitTransaction();
    void rollbackTransaction();
    void persistOrThrow() const;

    std::vector<Sector> sectors;                 // 区域，按布局顺序
    std::vector<Spot> spots;                     // 车位，按布局顺序
    std::map<std::string, size_t> spotIndex;     // 车位编号 -> spots下标
    std::vector<Session> sessions;               // 全部会话（只追加）
    std::map<std::string, size_t> activeIndex;   // 车牌号 -> 在场会话下标
    long long nextSessionId;
    std::string dataFilePath;

    // 并发控制
    mutable std::shared_mutex mutex;             // 数据读写锁
    mutable std::mutex unitMutex;                // 工作单元串行化
    mutable std::mutex fileMutex;                // 文件操作互斥锁

    // 撤销日志，仅由持有unitMutex的线程访问
    std::vector<std::function<void()>> undoLog;
    std::atomic<std::thread::id> unitOwner;
};
