#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "backend/remote_result.hpp"
#include "common/verdict.hpp"

namespace streamjudge::backend {

/**
 * @brief 编译得到的可执行文件
 * 对编排器来说是不透明的 json 值，原样传给每一次执行请求
 */
typedef nlohmann::json executable;

struct compile_request {
    std::string source_code;

    /**
     * @brief 编译选项，比如 "-O2 -std=c++17"
     */
    std::string compiler_options;

    /**
     * @brief 提交语言，比如 "cpp"、"java"、"py"
     */
    std::string language;
};

/**
 * @brief 编译结果
 * 编译成功时 artifact 不为空；编译失败或者编译服务出错时 artifact 为空
 */
struct compile_result {
    std::optional<executable> artifact;

    /**
     * @brief 编译器输出的诊断信息
     */
    std::optional<std::string> compile_output;

    /**
     * @brief 调用编译服务失败（网络错误或者无法解析返回内容）的原因
     */
    std::optional<std::string> internal_error;

    /**
     * @brief 编译服务返回的完整内容
     */
    nlohmann::json raw;

    bool success() const;
};

void to_json(nlohmann::json &j, const compile_result &result);

/**
 * @brief 选手程序的输入数据
 * content 与 input_id 中恰好有一个有值：
 * 小输入直接内联在请求中，大输入先上传，再传递上传得到的 input_id
 */
struct stdin_payload {
    std::optional<std::string> content;

    std::optional<std::string> input_id;
};

struct execution_request {
    executable artifact;

    stdin_payload input;

    /**
     * @brief 时间限制，单位为毫秒
     */
    int timeout_ms;

    /**
     * @brief 文件输入输出的文件名前缀
     */
    std::string file_io_name;
};

void to_json(nlohmann::json &j, const execution_request &request);

/**
 * @brief 单个测试点的运行结果
 * 要么是 internal_error（调用执行服务失败），要么是执行服务给出的评测结果
 */
struct execution_result {
    std::optional<std::string> internal_error;

    /**
     * @brief 执行服务返回的评测结果字符串，比如 "accepted"
     */
    std::string verdict_name;

    std::string standard_output;

    std::string standard_error;

    /**
     * @brief 文件输入输出模式下选手程序写出的文件内容
     */
    std::optional<std::string> file_output;

    /**
     * @brief 执行服务返回的其他字段，比如运行时间，原样返回给客户端
     */
    nlohmann::json extra = nlohmann::json::object();

    bool is_internal_error() const;

    streamjudge::verdict get_verdict() const;

    /**
     * @brief 构造一个表示调用失败的结果
     */
    static execution_result failure(const std::string &message);
};

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 执行服务分配的大输入上传位置
 */
struct large_input_slot {
    /**
     * @brief 预签名的上传地址，直接 PUT 输入数据
     */
    std::string presigned_url;

    /**
     * @brief 上传完成后在执行请求中引用输入数据的 id
     */
    std::string input_id;
};

void from_json(const nlohmann::json &j, large_input_slot &slot);

/**
 * @brief 外部执行服务（编译和沙箱运行）的客户端
 * 实现必须允许多个线程同时调用 execute、request_large_input_slot 和 upload_large_input。
 * 所有方法都不抛出异常，远程调用的错误通过返回值表示。
 */
struct execution_client {
    virtual ~execution_client();

    /**
     * @brief 编译选手代码
     * @return 编译结果，网络错误或无法解析的返回内容转为 internal_error
     */
    virtual compile_result compile(const compile_request &request) = 0;

    /**
     * @brief 在执行服务上运行一个测试点
     * @return 运行结果，网络错误或无法解析的返回内容转为 internal_error
     */
    virtual execution_result execute(const execution_request &request) = 0;

    /**
     * @brief 申请一个大输入上传位置
     */
    virtual remote_result<large_input_slot> request_large_input_slot() = 0;

    /**
     * @brief 将输入数据上传到 slot
     * @return 上传请求的 HTTP 状态码
     */
    virtual remote_result<long> upload_large_input(const large_input_slot &slot, const std::string &content) = 0;
};

}  // namespace streamjudge::backend
