#pragma once

#include <memory>
#include "backend/execution_client.hpp"
#include "common/cancellation.hpp"
#include "common/net_utils.hpp"
#include "config.hpp"

namespace streamjudge::backend {

/**
 * @brief 通过 HTTP 调用执行服务
 * 
 * 编译：POST compile_url {source_code, compiler_options, language}
 *      -> {executable, compile_output} 或错误信息
 * 运行：POST execute_url {executable, options: {stdin | stdin_id, timeout_ms, file_io_name}}
 *      -> {verdict, stdout, stderr, file_output, full_output_url?}
 * 若返回内容过大，执行服务只返回 full_output_url，需要再 GET 一次拿到完整结果。
 * 大输入：POST large_input_url -> {presigned_url, input_id}，然后 PUT 到 presigned_url。
 */
struct http_execution_client : public execution_client {
    http_execution_client(const configuration &config, const cancellation_token &cancel);

    /**
     * @param transport 发送 HTTP 请求的方式，默认为 net::curl_transport
     */
    http_execution_client(const configuration &config, const cancellation_token &cancel,
                          std::shared_ptr<net::http_transport> transport);

    compile_result compile(const compile_request &request) override;

    execution_result execute(const execution_request &request) override;

    remote_result<large_input_slot> request_large_input_slot() override;

    remote_result<long> upload_large_input(const large_input_slot &slot, const std::string &content) override;

private:
    configuration config;
    net::request_options options;
    std::shared_ptr<net::http_transport> transport;
};

/**
 * @brief 解析编译服务的返回内容
 * 无法解析的内容转为 internal_error，内容为原始返回文本
 */
compile_result decode_compile_response(const std::string &text);

/**
 * @brief 解析执行服务的返回内容
 * 无法解析的内容转为 internal_error，内容为原始返回文本
 */
execution_result decode_execution_response(const std::string &text);

}  // namespace streamjudge::backend
