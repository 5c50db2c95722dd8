#pragma once

#include <string>

namespace streamjudge {

/**
 * @brief 表示一个测试点的评测结果
 * 执行服务可能返回此处未列出的结果，这些结果归为 OTHER，原始字符串原样返回给客户端
 */
enum class verdict {
    /**
     * @brief 程序正常结束且输出正确
     */
    ACCEPTED,

    /**
     * @brief 答案错误
     * 执行服务返回 accepted 但去掉首尾空白字符后输出与标准输出不一致时，也会改为 WA
     */
    WRONG_ANSWER,

    /**
     * @brief 程序运行时错误，比如非零返回值、段错误
     */
    RUNTIME_ERROR,

    /**
     * @brief 程序运行时间超出限制
     */
    TIME_LIMIT_EXCEEDED,

    /**
     * @brief 程序运行内存超限
     */
    MEMORY_LIMIT_EXCEEDED,

    /**
     * @brief 程序输出内容过多
     */
    OUTPUT_LIMIT_EXCEEDED,

    /**
     * @brief 编译错误
     */
    COMPILE_ERROR,

    /**
     * @brief 其他由执行服务定义的结果
     */
    OTHER
};

/**
 * @brief 将执行服务返回的结果字符串转换为 verdict
 * @param name 比如 "accepted"、"wrong_answer"
 */
verdict parse_verdict(const std::string &name);

/**
 * @brief verdict 在执行服务协议中的名字
 * @note OTHER 没有对应的名字，返回 "other"
 */
const char *verdict_name(verdict value);

}  // namespace streamjudge
