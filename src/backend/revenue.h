/**
 * @file revenue.h
 * @brief 营收统计
 */
#pragma once
#include "logger.h"
#include "repositories.h"
#include <ctime>
#include <string>

/**
 * @class RevenueAggregator
 * @brief 只读查询：某区域某个UTC日期内离场会话的费用总和
 */
class RevenueAggregator {
public:
    RevenueAggregator(const SessionRepository& sessions, Logger& logger);

    /**
     * @brief 统计营收
     * @param sector 区域名称（精确匹配，区分大小写）
     * @param day 当天任意时刻，按UTC日历日计算
     * @return 没有匹配会话时为0
     * @throws StoreError 存储不可用时向调用方传播
     */
    Cents revenue(const std::string& sector, time_t day) const;

    /**
     * @brief 计算给定时刻所在UTC日的零点
     */
    static time_t startOfDay(time_t t);

private:
    const SessionRepository& sessions;
    Logger& logger;
};
