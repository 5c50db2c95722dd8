#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace streamjudge {

/**
 * @brief 并发队列，多写者单读者模型
 * 队列关闭后不再接受新元素，读者取完剩余元素后得到 nullopt。
 * 评测编排器用它把编译事件和各测试点的评测结果按完成顺序汇总到同一个输出通道。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 队列头元素，若队列已关闭且为空则返回 nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || is_closed; });
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        return result;
    }

    /**
     * @brief 与 pop() 相同，但最多等待 timeout
     * @return 队列头元素，若超时或者队列已关闭且为空则返回 nullopt
     */
    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!cond.wait_for(mlock, timeout, [this] { return !q.empty() || is_closed; }))
            return std::nullopt;
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 若队列已经关闭，元素被丢弃并返回 false
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (is_closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者
     * 已经在队列中的元素仍然可以被读出
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        is_closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    /**
     * @brief 丢弃队列中尚未读出的元素
     */
    void clear() {
        std::scoped_lock<std::mutex> mlock(mut);
        std::queue<T>().swap(q);
    }

    bool closed() const {
        std::scoped_lock<std::mutex> mlock(mut);
        return is_closed;
    }

    /**
     * @brief 队列已关闭并且所有元素都已读出，之后不会再有新元素
     */
    bool drained() const {
        std::scoped_lock<std::mutex> mlock(mut);
        return is_closed && q.empty();
    }

private:
    std::queue<T> q;
    bool is_closed = false;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace streamjudge
