/**
 * @file time_utils.h
 * @brief UTC时间解析与格式化工具
 *
 * 所有时间戳在系统内部统一为UTC的time_t（秒）。
 */
#pragma once
#include <ctime>
#include <string>

/**
 * @brief 解析ISO-8601时间戳
 * @param text 例：2025-01-01T12:00:00Z、2025-01-01T09:00:00.500-03:00、2025-01-01 12:00:00
 * @param[out] out 解析得到的UTC时间
 * @return 格式是否合法
 *
 * 小数秒会被截断；没有时区后缀时按UTC处理。
 */
bool parseIso8601(const std::string& text, time_t& out);

/**
 * @brief 格式化为ISO-8601 UTC时间戳（YYYY-MM-DDTHH:MM:SSZ）
 */
std::string formatIso8601(time_t t);

/**
 * @brief 解析日历日期（YYYY-MM-DD）
 * @param text 日期字符串
 * @param[out] dayStart 当天UTC零点
 * @return 日期是否合法（会拒绝2月30日之类的日期）
 */
bool parseDate(const std::string& text, time_t& dayStart);

std::string formatDate(time_t t);

// 一天的秒数
constexpr time_t SECONDS_PER_DAY = 24 * 60 * 60;
