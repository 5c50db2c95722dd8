#pragma once

#include <memory>
#include "backend/execution_client.hpp"
#include "common/cancellation.hpp"
#include "config.hpp"
#include "judge/judge_run.hpp"
#include "problem/problem_resolver.hpp"
#include "stream/event_stream.hpp"

namespace streamjudge {

/**
 * @brief 评测入口：查找题目并启动评测
 */
struct judge_service {
    judge_service(const problem_resolver &resolver, backend::execution_client &client,
                  const configuration &config, const cancellation_token &cancel);

    /**
     * @brief 提交一次评测
     * 题目不存在等错误在开始输出事件流之前以异常的形式抛出
     * @return 已经启动的评测，通过 judge_run::next 读取事件
     * @throws invalid_problem_id, problem_not_found, test_data_not_found
     */
    std::unique_ptr<judge_run> submit(const judge_submission &submission) const;

private:
    const problem_resolver &resolver;
    backend::execution_client &client;
    configuration config;
    cancellation_token cancel;
};

/**
 * @brief 将评测的所有事件写入 writer
 * 若写入失败（客户端断开连接），则取消评测
 * @return E_SUCCESS；若客户端断开连接或者评测被取消返回 E_STREAM_CLOSED；
 *         若事件流以 error 事件结束返回 E_INTERNAL_ERROR
 */
error_codes stream_judge_run(judge_run &run, stream::event_stream_writer &writer);

}  // namespace streamjudge
