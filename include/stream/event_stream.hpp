#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "backend/execution_client.hpp"

namespace streamjudge::stream {

enum class event_type {
    /**
     * @brief 编译结果，每次评测恰好一个，并且是第一个事件
     */
    COMPILE,

    /**
     * @brief 一个测试点的评测结果
     */
    EXECUTE,

    /**
     * @brief 编译成功之后评测流程出现意外错误，之后不会再有事件
     */
    ERROR
};

const char *event_name(event_type type);

struct stream_event {
    event_type type;

    nlohmann::json data;
};

/**
 * @brief compile 事件的内容
 * 编译服务返回了 compile_output 时只返回 compile_output 字符串，否则返回编译服务的完整返回内容
 */
nlohmann::json compile_event_data(const backend::compile_result &result);

stream_event make_compile_event(const backend::compile_result &result);

stream_event make_execute_event(const nlohmann::json &data);

/**
 * @brief 构造 error 事件，包含错误描述、异常类型和调用栈
 */
stream_event make_error_event(const std::exception &ex);

/**
 * @brief 按照 text/event-stream 格式编码事件
 * 格式为 "event: <name>\ndata: <json>\n\n"，json 中不会出现换行
 */
std::string encode(const stream_event &event);

/**
 * @brief 将事件逐个写入输出流，每个事件写完后立即 flush
 * 客户端可以边接收边处理
 */
struct event_stream_writer {
    explicit event_stream_writer(std::ostream &out);

    /**
     * @return 若输出流已经不可写（比如客户端断开连接）返回 false
     */
    bool write(const stream_event &event);

    std::size_t written() const;

private:
    std::ostream &out;
    std::size_t count = 0;
};

}  // namespace streamjudge::stream
