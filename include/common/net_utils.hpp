#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/cancellation.hpp"

namespace streamjudge::net {

/**
 * @brief 单次 HTTP 请求的参数
 */
struct request_options {
    /**
     * @brief 建立连接的最长时间，单位为秒
     */
    double connect_timeout = 10.0;

    /**
     * @brief 整个请求的最长时间，单位为秒，0 表示不限制
     */
    double timeout = 0;

    /**
     * @brief 取消标记被设置后，正在进行的传输会被中止并抛出 network_error
     */
    cancellation_token cancel;
};

struct http_response {
    long status_code;
    std::string text;

    bool ok() const;
};

/**
 * @brief 初始化 libcurl 的全局状态
 * 必须在启动任何线程之前调用一次
 */
void global_init();

void global_cleanup();

/**
 * @brief 发送 POST 请求，请求体为 json
 * @param url post 请求地址
 * @param post post 请求体
 * @return 响应状态码和响应内容，不检查状态码
 * @throws network_error 若无法完成请求（连接失败、超时、被取消）
 */
http_response post_json(const std::string &url, const nlohmann::json &post, const request_options &options);

/**
 * @brief 发送 GET 请求
 * @param url GET 请求地址
 * @return 响应状态码和响应内容，不检查状态码
 * @throws network_error 若无法完成请求
 */
http_response get(const std::string &url, const request_options &options);

/**
 * @brief 通过 PUT 请求把 content 上传到 url
 * 用于将大输入数据上传到预签名地址
 * @throws network_error 若无法完成请求
 */
http_response put(const std::string &url, const std::string &content, const request_options &options);

/**
 * @brief 发送 HTTP 请求的接口
 * 执行服务客户端通过该接口访问网络，测试时替换为 mock
 */
struct http_transport {
    virtual ~http_transport();

    virtual http_response post_json(const std::string &url, const nlohmann::json &post, const request_options &options) = 0;

    virtual http_response get(const std::string &url, const request_options &options) = 0;

    virtual http_response put(const std::string &url, const std::string &content, const request_options &options) = 0;
};

/**
 * @brief 通过 libcurl 发送请求，线程安全
 */
struct curl_transport : public http_transport {
    http_response post_json(const std::string &url, const nlohmann::json &post, const request_options &options) override;

    http_response get(const std::string &url, const request_options &options) override;

    http_response put(const std::string &url, const std::string &content, const request_options &options) override;
};

}  // namespace streamjudge::net
