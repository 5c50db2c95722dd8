#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "backend/execution_client.hpp"
#include "gmock/gmock.h"
#include "problem/problem.hpp"

namespace streamjudge::test {

struct mock_execution_client : public backend::execution_client {
    MOCK_METHOD(backend::compile_result, compile, (const backend::compile_request &), (override));
    MOCK_METHOD(backend::execution_result, execute, (const backend::execution_request &), (override));
    MOCK_METHOD(backend::remote_result<backend::large_input_slot>, request_large_input_slot, (), (override));
    MOCK_METHOD(backend::remote_result<long>, upload_large_input, (const backend::large_input_slot &, const std::string &), (override));
};

/**
 * @brief 预先设定好返回结果的执行服务
 * 以输入数据（或者大输入的 input_id）为键查找运行结果，可以为每个测试点设置延迟，
 * 用于测试多个测试点并发评测时的结果顺序。
 */
struct fake_execution_client : public backend::execution_client {
    struct scripted_run {
        std::chrono::milliseconds delay{0};
        backend::execution_result result;
    };

    backend::compile_result compile_response;
    std::chrono::milliseconds compile_delay{0};

    std::map<std::string, scripted_run> runs;

    bool fail_slot = false;
    bool fail_upload = false;

    std::atomic<int> compile_count{0};
    std::atomic<int> execute_count{0};

    backend::compile_result compile(const backend::compile_request &) override {
        ++compile_count;
        std::this_thread::sleep_for(compile_delay);
        return compile_response;
    }

    backend::execution_result execute(const backend::execution_request &request) override {
        ++execute_count;
        std::string key = request.input.content ? *request.input.content : request.input.input_id.value_or("");
        auto it = runs.find(key);
        if (it == runs.end())
            return backend::execution_result::failure("no scripted run for input " + key);
        std::this_thread::sleep_for(it->second.delay);
        return it->second.result;
    }

    backend::remote_result<backend::large_input_slot> request_large_input_slot() override {
        if (fail_slot)
            return backend::remote_failure{"request large input slot: status code=503"};
        std::scoped_lock<std::mutex> lock(mut);
        std::string id = "input-" + std::to_string(++slots);
        return backend::large_input_slot{"https://storage.example.com/" + id, id};
    }

    backend::remote_result<long> upload_large_input(const backend::large_input_slot &slot, const std::string &content) override {
        if (fail_upload)
            return backend::remote_failure{"upload large input: connection reset"};
        std::scoped_lock<std::mutex> lock(mut);
        uploads[slot.input_id] = content;
        return 200L;
    }

    std::map<std::string, std::string> uploaded() {
        std::scoped_lock<std::mutex> lock(mut);
        return uploads;
    }

private:
    std::mutex mut;
    int slots = 0;
    std::map<std::string, std::string> uploads;
};

inline backend::compile_result compiled_artifact() {
    backend::compile_result result;
    result.raw = {{"executable", {{"id", "exe-1"}}}, {"compile_output", ""}};
    result.artifact = result.raw.at("executable");
    result.compile_output = "";
    return result;
}

inline backend::execution_result run_result(const std::string &verdict, const std::string &standard_output,
                                            const std::string &standard_error = "") {
    backend::execution_result result;
    result.verdict_name = verdict;
    result.standard_output = standard_output;
    result.standard_error = standard_error;
    return result;
}

/**
 * @brief 构造一道测试数据保存在内存中的题目
 * @param tests 每个测试点的 {输入, 标准输出}
 */
inline problem make_problem(const std::vector<std::pair<std::string, std::string>> &tests, int time_limit_ms = 1000) {
    problem prob;
    prob.id = "1001";
    prob.test_data_id = "1001";
    prob.time_limit_ms = time_limit_ms;
    for (auto &[input, output] : tests) {
        test_case testcase;
        testcase.index = prob.test_cases.size() + 1;
        testcase.input = std::make_shared<text_asset>(std::to_string(testcase.index) + ".in", input);
        testcase.output = std::make_shared<text_asset>(std::to_string(testcase.index) + ".out", output);
        prob.test_cases.push_back(std::move(testcase));
    }
    return prob;
}

}  // namespace streamjudge::test
