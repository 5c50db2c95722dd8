#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace streamjudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 异常抛出时记录的调用栈
     * 在 error 事件中作为 stacktrace 字段返回给客户端
     */
    std::string stack_trace() const;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测编排器的内部错误
 * 一般是程序本身或者运行环境的问题
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public judge_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 配置文件或命令行参数不合法
 */
struct configuration_error : public judge_exception {
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 题目编号格式不合法，比如缺少 usaco- 前缀
 * 在开始输出事件流之前拒绝
 */
struct invalid_problem_id : public judge_exception {
    explicit invalid_problem_id(const std::string &message);
};

/**
 * @brief 找不到请求的资源
 */
struct not_found_error : public judge_exception {
    explicit not_found_error(const std::string &message);
};

/**
 * @brief 题库中不存在该题目
 */
struct problem_not_found : public not_found_error {
    explicit problem_not_found(const std::string &problem_id);
};

/**
 * @brief 题目存在，但是还没有对应的测试数据
 */
struct test_data_not_found : public not_found_error {
    explicit test_data_not_found(const std::string &problem_id);

    /**
     * @brief 题目编号只用于日志，不出现在返回给客户端的错误信息中
     */
    std::string problem_id;
};

}  // namespace streamjudge
