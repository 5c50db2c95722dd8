#pragma once

#include <string>
#include "backend/execution_client.hpp"

namespace streamjudge {

/**
 * @brief 大输入数据转存
 * 执行服务对请求体大小有上限，输入数据达到 threshold 字节时，
 * 先向执行服务申请上传地址并上传数据，执行请求中只携带上传得到的 input_id。
 */
struct large_input_offloader {
    large_input_offloader(backend::execution_client &client, std::size_t threshold);

    /**
     * @brief 输入数据是否需要转存
     */
    bool should_offload(const std::string &input) const;

    /**
     * @brief 准备执行请求中的输入数据
     * @return 小于 threshold 时内联返回；否则上传并返回 input_id；上传失败返回失败原因
     */
    backend::remote_result<backend::stdin_payload> stage(const std::string &input) const;

private:
    backend::execution_client &client;
    std::size_t threshold;
};

}  // namespace streamjudge
