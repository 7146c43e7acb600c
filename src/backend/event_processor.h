/**
 * @file event_processor.h
 * @brief 车辆事件处理器 - 状态转换核心
 */
#pragma once
#include "logger.h"
#include "repositories.h"
#include "vehicle_event.h"

/**
 * @brief 单个事件的处理结果
 */
enum class EventOutcome {
    APPLIED,               // 状态已更新
    INVALID_EVENT,         // 缺少字段或类型无法识别
    DUPLICATE_ENTRY,       // 车牌已有在场会话
    NO_ACTIVE_SESSION,     // PARKED/EXIT之前没有ENTRY
    ALREADY_PARKED,        // 会话已占用车位
    NO_SPOT_IN_TOLERANCE,  // GPS容差内没有空闲车位
    UNKNOWN_SECTOR,        // 车位引用了不存在的区域
    SECTOR_FULL            // 区域已满
};

const char* eventOutcomeName(EventOutcome outcome);

/**
 * @class EventProcessor
 * @brief 维护每辆车的在场会话，分配车位并计算价格
 *
 * 每个事件是一个独立的工作单元：所有前置条件检查通过后才写入，
 * 车位占用标志和会话车位字段在同一工作单元内一起提交或一起回滚。
 *
 * processEvent永不抛出异常，所有失败都归一为false并记录日志。
 */
class EventProcessor {
public:
    // GPS匹配容差（经纬度各自的绝对差，严格小于）
    static constexpr double GPS_TOLERANCE = 0.0001;

    EventProcessor(SessionRepository& sessions,
                   LayoutRepository& layout,
                   UnitOfWork& unitOfWork,
                   Logger& logger);

    EventProcessor(const EventProcessor&) = delete;
    EventProcessor& operator=(const EventProcessor&) = delete;

    /**
     * @brief 处理传输层的原始事件
     * @return 是否成功；校验失败、业务冲突、存储异常都返回false
     */
    bool processEvent(const RawVehicleEvent& raw);

    /**
     * @brief 处理已解码的事件
     */
    bool processEvent(const VehicleEvent& event);

    /**
     * @brief 在一个工作单元内执行状态转换
     * @return 带类型的处理结果，只有APPLIED会提交
     * @throws StoreError 存储不可用
     */
    EventOutcome apply(const VehicleEvent& event);

private:
    EventOutcome applyEntry(const EntryEvent& event);
    EventOutcome applyParked(const ParkedEvent& event);
    EventOutcome applyExit(const ExitEvent& event);

    SessionRepository& sessions;
    LayoutRepository& layout;
    UnitOfWork& unitOfWork;
    Logger& logger;
};
