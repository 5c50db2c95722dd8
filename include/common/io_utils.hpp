#pragma once

#include <filesystem>
#include <string>

namespace streamjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throws internal_error 若文件不存在或无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 题目配置中的测试数据路径来自外部文件，如果拿到的文件名包含 "../"，
 * 则可能读到测试数据目录之外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 将 UTF-8 字符串截断为最多 max_chars 个字符（码点）
 * 不会把一个多字节字符截成两半
 */
std::string utf8_truncate(const std::string &str, std::size_t max_chars);

}  // namespace streamjudge
