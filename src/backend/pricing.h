/**
 * @file pricing.h
 * @brief 动态定价与停车费计算
 *
 * 金额统一使用"分"为单位的整数（Cents），保证营收求和精确。
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

using Cents = std::int64_t;

// 免费时长（分钟）
constexpr int GRACE_PERIOD_MINUTES = 30;

/**
 * @brief 计算占用率
 * @param occupied 当前已占用车位数（本次分配之前）
 * @param capacity 区域容量
 * @return occupied / capacity；容量为0时不做除法
 */
double occupancyRate(std::size_t occupied, int capacity);

/**
 * @brief 占用率对应的价格倍率（百分比）
 *
 * <25% → 90，<50% → 100，<75% → 110，其余 → 125
 */
int priceMultiplierPercent(double occupancyRate);

/**
 * @brief 根据占用率计算本次停车锁定的小时单价
 * @param basePrice 区域基础价格
 * @param occupancyRate 分配车位前的占用率
 * @return 基础价格乘以倍率，四舍五入到分
 */
Cents dynamicPrice(Cents basePrice, double occupancyRate);

/**
 * @brief 计算离场费用
 * @param duration 停车时长
 * @param appliedBasePrice 入位时锁定的小时单价
 * @return 30分钟内免费；超出部分按小时向上取整计费
 */
Cents parkingFee(std::chrono::seconds duration, Cents appliedBasePrice);

/**
 * @brief 计费小时数（不含免费时长，向上取整）
 */
long long billableHours(std::chrono::seconds duration);

// 金额转换
Cents toCents(double amount);
double toAmount(Cents cents);
std::string formatCents(Cents cents);
