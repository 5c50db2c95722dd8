#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include "backend/execution_client.hpp"
#include "common/cancellation.hpp"
#include "config.hpp"
#include "judge/offloader.hpp"
#include "problem/problem.hpp"

namespace streamjudge {

/**
 * @brief 一个测试点的最终结果，附带用于对应测试点的编号
 */
struct test_case_result {
    /**
     * @brief 测试点编号，从 1 开始
     */
    std::size_t index;

    /**
     * @brief 测试点总数
     */
    std::size_t total;

    backend::execution_result result;
};

/**
 * @brief 序列化为 execute 事件的内容：评测结果字段加上 test_case 和 num_test_cases
 */
void to_json(nlohmann::json &j, const test_case_result &result);

/**
 * @brief 将所有测试点并发地发送给执行服务
 * 每个测试点一个线程，测试点之间没有依赖，也不共享可变状态。
 * 先完成的测试点先返回结果，而不是按照测试点编号的顺序。
 */
struct fan_out_dispatcher {
    fan_out_dispatcher(backend::execution_client &client, const configuration &config, const cancellation_token &cancel);

    /**
     * @brief 评测所有测试点，阻塞直到所有测试点都给出结果
     * 每个测试点恰好产生一个结果（评测结果、internal_error 或者大输入转存失败），
     * 不会因为某个测试点失败而影响其他测试点。
     * @param artifact 编译得到的可执行文件
     * @param prob 题目
     * @param on_result 每个测试点完成时在该测试点的线程中调用，必须是线程安全的
     * @param on_dispatched 所有测试点线程都启动之后调用
     * @throws internal_error 若某个测试点缺少输入或标准输出，此时不会启动任何线程
     * @throws std::system_error 若无法创建线程，此时已经启动的线程会被取消并等待结束
     */
    void dispatch(const backend::executable &artifact, const problem &prob,
                  const std::function<void(test_case_result &&)> &on_result,
                  const std::function<void()> &on_dispatched = nullptr) const;

    /**
     * @brief 评测单个测试点，不抛出异常
     * 读取测试数据、转存大输入、调用执行服务、复核结果
     */
    backend::execution_result judge_one(const backend::executable &artifact, const problem &prob, const test_case &testcase) const;

private:
    backend::execution_client &client;
    configuration config;
    cancellation_token cancel;
    large_input_offloader offloader;
};

}  // namespace streamjudge
