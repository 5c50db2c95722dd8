#pragma once

#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "common/exceptions.hpp"

namespace streamjudge::backend {

/**
 * @brief 远程调用失败的原因
 */
struct remote_failure {
    std::string message;
};

/**
 * @brief 远程调用的结果：要么是返回值，要么是失败原因
 * 执行服务不受本系统控制，所有远程调用的错误都转换成该类型的值返回，
 * 不以异常的形式穿过组件边界。
 */
template <typename T>
struct remote_result {
    remote_result(T value) : data(std::in_place_index<0>, std::move(value)) {}

    remote_result(remote_failure failure) : data(std::in_place_index<1>, std::move(failure)) {}

    bool ok() const {
        return data.index() == 0;
    }

    /**
     * @throws internal_error 若远程调用失败
     */
    const T &value() const {
        if (!ok()) throw internal_error("Accessing the value of a failed remote call: " + error());
        return std::get<0>(data);
    }

    /**
     * @throws internal_error 若远程调用成功
     */
    const std::string &error() const {
        if (ok()) throw internal_error("Accessing the error of a successful remote call");
        return std::get<1>(data).message;
    }

private:
    std::variant<T, remote_failure> data;
};

/**
 * @brief 执行远程调用 fn，将其抛出的异常转换为 remote_failure
 * @param what 调用的描述，作为失败原因的前缀
 */
template <typename Fn>
auto capture_remote(const std::string &what, Fn &&fn) -> remote_result<std::invoke_result_t<Fn>> {
    try {
        return fn();
    } catch (network_error &ex) {
        LOG(WARNING) << what << " failed: " << ex.what();
        return remote_failure{what + ": " + ex.what()};
    } catch (nlohmann::json::exception &ex) {
        LOG(WARNING) << what << " returned malformed json: " << ex.what();
        return remote_failure{what + ": " + ex.what()};
    } catch (std::exception &ex) {
        LOG(WARNING) << what << " failed: " << ex.what();
        return remote_failure{what + ": " + ex.what()};
    }
}

}  // namespace streamjudge::backend
