#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "config.hpp"
#include "problem/problem.hpp"

namespace streamjudge {

/**
 * @brief 根据题目编号查找题目及其测试数据
 */
struct problem_resolver {
    virtual ~problem_resolver();

    /**
     * @brief 查找题目
     * @param problem_id 客户端提交的题目编号，比如 usaco-1001
     * @throws invalid_problem_id 题目编号格式不对
     * @throws problem_not_found 题库中没有该题目
     * @throws test_data_not_found 题目存在但是没有测试数据
     */
    virtual problem resolve(const std::string &problem_id) const = 0;

    /**
     * @brief 返回整个题库
     */
    virtual nlohmann::json list_problems() const = 0;
};

/**
 * @brief 从本地 json 文件中读取题目信息
 * 文件结构见 configuration::data_dir，每次调用都重新读取文件，不做缓存
 */
struct local_problem_resolver : public problem_resolver {
    explicit local_problem_resolver(const configuration &config);

    problem resolve(const std::string &problem_id) const override;

    nlohmann::json list_problems() const override;

private:
    configuration config;
};

/**
 * @brief 检查并去掉题目编号的前缀
 * @throws invalid_problem_id 若题目编号不以 prefix 开头
 */
std::string strip_problem_id_prefix(const std::string &problem_id, const std::string &prefix);

}  // namespace streamjudge
