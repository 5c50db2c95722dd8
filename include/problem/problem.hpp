#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "problem/asset.hpp"

namespace streamjudge {

/**
 * @brief 表示一个测试点
 */
struct test_case {
    /**
     * @brief 测试点编号，从 1 开始，即在题目配置中的顺序
     * 评测结果按完成顺序返回，客户端通过该编号对应测试点
     */
    std::size_t index;

    /**
     * @brief 输入数据，作为选手程序的 stdin（或者 file_io_name.in）
     */
    asset_ptr input;

    /**
     * @brief 标准输出
     */
    asset_ptr output;
};

/**
 * @brief 一道题目
 * 每次评测请求都重新加载，加载之后不再修改
 */
struct problem {
    /**
     * @brief 去掉前缀后的题目编号
     */
    std::string id;

    /**
     * @brief 测试数据编号，对应测试数据目录下的子文件夹
     */
    std::string test_data_id;

    /**
     * @brief 每个测试点的时间限制，单位为毫秒
     */
    int time_limit_ms;

    /**
     * @brief 文件输入输出的文件名前缀，比如 shortname 为 "cowjump" 时
     * 选手程序可以读 cowjump.in 写 cowjump.out
     */
    std::string file_io_name;

    std::vector<test_case> test_cases;

    /**
     * @brief 题库中该题的原始信息
     */
    nlohmann::json metadata;
};

}  // namespace streamjudge
