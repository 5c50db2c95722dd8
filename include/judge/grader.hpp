#pragma once

#include <string>
#include "backend/execution_client.hpp"

namespace streamjudge {

/**
 * @brief 检查程序输出与标准输出是否一致
 * 两者都去掉首尾空白字符后逐字节比较
 */
bool outputs_match(const std::string &program_output, const std::string &expected_output);

/**
 * @brief 选手程序的输出：文件输出非空时使用文件输出，否则使用标准输出
 */
const std::string &program_output(const backend::execution_result &result);

/**
 * @brief 复核执行服务的评测结果
 * 执行服务给出的 accepted 并不知道题目的比较方式，因此对 accepted 再做一次精确比较，
 * 不一致时改为 wrong_answer。其他结果和 internal_error 原样返回。
 * @param result 执行服务返回的未截断结果
 * @param expected_output 标准输出
 */
backend::execution_result regrade(const backend::execution_result &result, const std::string &expected_output);

/**
 * @brief 将 stdout、stderr、file_output 截断为最多 limit 个字符
 * 只用于控制返回给客户端的数据量
 */
backend::execution_result truncate_output(const backend::execution_result &result, std::size_t limit);

/**
 * @brief 先复核评测结果，再截断输出
 */
backend::execution_result grade(const backend::execution_result &result, const std::string &expected_output, std::size_t limit);

}  // namespace streamjudge
