#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include "backend/execution_client.hpp"
#include "common/cancellation.hpp"
#include "common/concurrent_queue.hpp"
#include "config.hpp"
#include "problem/problem.hpp"
#include "stream/event_stream.hpp"

namespace streamjudge {

/**
 * @brief 评测的状态
 *
 * CREATED -> COMPILING -> COMPILE_FAILED
 *                      -> DISPATCHING -> STREAMING -> DONE
 */
enum class run_state {
    CREATED,

    /**
     * @brief 正在等待编译服务返回
     */
    COMPILING,

    /**
     * @brief 编译失败，只输出 compile 事件，终止状态
     */
    COMPILE_FAILED,

    /**
     * @brief 正在为每个测试点启动评测线程
     */
    DISPATCHING,

    /**
     * @brief 所有测试点都已启动，等待全部完成
     */
    STREAMING,

    /**
     * @brief 所有结果都已输出，或者评测被取消，或者出现了意外错误
     */
    DONE
};

const char *state_name(run_state state);

/**
 * @brief 客户端提交的评测请求
 */
struct judge_submission {
    /**
     * @brief 带前缀的题目编号，比如 usaco-1001
     */
    std::string problem_id;

    std::string source_code;

    std::string compiler_options;

    std::string language;
};

/**
 * @brief 一次评测
 * 评测在后台线程中进行，调用方通过 next() 按顺序读取事件：
 * 第一个事件总是 compile，之后是按完成顺序排列的 execute 事件，
 * 若编译成功后出现意外错误，则以一个 error 事件结束。
 *
 * 对象析构时会取消尚未完成的测试点并等待后台线程结束。
 */
struct judge_run {
    judge_run(problem prob, judge_submission submit, backend::execution_client &client,
              const configuration &config, const cancellation_token &cancel);

    judge_run(const judge_run &) = delete;

    judge_run &operator=(const judge_run &) = delete;

    ~judge_run();

    /**
     * @brief 启动后台评测线程，只能调用一次
     */
    void start();

    /**
     * @brief 读取下一个事件，若还没有事件则阻塞等待
     * 若取消标记在别处被设置（比如收到 SIGINT），等价于调用 cancel()
     * @return 下一个事件，事件流结束或者评测被取消时返回 nullopt
     */
    std::optional<stream::stream_event> next();

    /**
     * @brief 客户端断开连接时调用
     * 中止正在进行的远程调用，尚未开始的测试点不再调用执行服务，事件流立即结束
     */
    void cancel();

    run_state state() const;

    bool cancelled() const;

    const problem &get_problem() const;

private:
    void run();

    void set_state(run_state state);

    problem prob;
    judge_submission submit;
    backend::execution_client &client;
    configuration config;
    cancellation_token cancellation;
    concurrent_queue<stream::stream_event> events;
    std::atomic<run_state> current_state;
    std::thread coordinator;
};

}  // namespace streamjudge
