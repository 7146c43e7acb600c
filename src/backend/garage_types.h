/**
 * @file garage_types.h
 * @brief 车库布局数据结构：区域与车位
 */
#pragma once
#include "pricing.h"
#include <string>
#include <vector>

/**
 * @brief 车库区域
 *
 * 启动时加载一次，之后不再修改。容量按区域单独计算。
 */
struct Sector {
    std::string name;        // 区域名称（区分大小写）
    Cents basePrice = 0;     // 基础小时单价
    int maxCapacity = 0;     // 区域容量
};

/**
 * @brief 物理车位
 *
 * occupied是唯一可变字段，由事件处理器切换。
 */
struct Spot {
    std::string spotId;
    std::string sectorName;
    double lat = 0.0;
    double lng = 0.0;
    bool occupied = false;
};

/**
 * @brief 布局提供方返回的完整车库配置
 */
struct GarageLayout {
    std::vector<Sector> sectors;
    std::vector<Spot> spots;
};

/**
 * @brief 区域当前状态（用于状态查询）
 */
struct SectorStatus {
    Sector sector;
    std::size_t occupied = 0;
};
