#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "common/cancellation.hpp"
#include "common/net_utils.hpp"

namespace streamjudge {

/**
 * @class asset
 * @brief 远程或本地的测试数据文件
 * 测试点只保存数据的引用，内容在评测该测试点的线程中才读取，
 * 避免一次性把整道题的测试数据读进内存。
 */
struct asset {
    /**
     * @brief 测试数据的名字，用于日志和报错
     */
    std::string name;

    explicit asset(const std::string &name);

    virtual ~asset();

    /**
     * @brief 读取测试数据的全部内容
     * @note 该函数在读取或下载过程中将阻塞
     * @note 该函数可以在多个线程中并发调用
     * @param cancel 评测被取消时中止下载
     * @throws judge_exception 若读取失败
     * @throws network_error 若下载失败或者被取消
     */
    virtual std::string read(const cancellation_token &cancel) const = 0;
};

/**
 * @brief 表示一个已经在本地的测试数据文件（不需要下载）
 */
struct local_asset : public asset {
    std::filesystem::path path;

    local_asset(const std::string &name, const std::filesystem::path &path);

    std::string read(const cancellation_token &cancel) const override;
};

/**
 * @brief 直接保存在内存中的测试数据
 */
struct text_asset : public asset {
    std::string text;

    text_asset(const std::string &name, const std::string &text);

    std::string read(const cancellation_token &cancel) const override;
};

/**
 * @brief 需要通过 HTTP 下载的测试数据
 */
struct remote_asset : public asset {
    std::string url;

    net::request_options options;

    remote_asset(const std::string &name, const std::string &url, const net::request_options &options);

    std::string read(const cancellation_token &cancel) const override;
};

typedef std::shared_ptr<const asset> asset_ptr;

}  // namespace streamjudge
