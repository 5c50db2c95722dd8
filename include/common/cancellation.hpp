#pragma once

#include <atomic>
#include <memory>

namespace streamjudge {

/**
 * @brief 协作式取消标记
 * 客户端断开连接时由 judge_run 设置，所有测试点线程和正在进行的 CURL 传输共享同一个标记。
 * 拷贝该对象得到的是同一个标记。
 */
struct cancellation_token {
    cancellation_token();

    void cancel() const;

    bool cancelled() const;

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

}  // namespace streamjudge
