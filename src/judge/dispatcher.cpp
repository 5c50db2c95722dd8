#include "judge/dispatcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include <thread>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/grader.hpp"

namespace streamjudge {
using namespace std;
using namespace nlohmann;
using namespace streamjudge::backend;

void to_json(json &j, const test_case_result &result) {
    j = result.result;
    j["test_case"] = result.index;
    j["num_test_cases"] = result.total;
}

fan_out_dispatcher::fan_out_dispatcher(execution_client &client, const configuration &config, const cancellation_token &cancel)
    : client(client), config(config), cancel(cancel), offloader(client, config.large_input_threshold) {}

execution_result fan_out_dispatcher::judge_one(const executable &artifact, const problem &prob, const test_case &testcase) const {
    if (cancel.cancelled())
        return execution_result::failure("Judge run cancelled");

    elapsed_time timer;
    try {
        string input = testcase.input->read(cancel);
        string expected_output = testcase.output->read(cancel);

        auto payload = offloader.stage(input);
        if (!payload.ok()) {
            LOG(WARNING) << "Test case " << testcase.index << " of problem " << prob.id << ": " << payload.error();
            return execution_result::failure(payload.error());
        }

        execution_request request{artifact, payload.value(), prob.time_limit_ms, prob.file_io_name};
        execution_result result = client.execute(request);
        if (result.is_internal_error()) {
            LOG(WARNING) << "Test case " << testcase.index << " of problem " << prob.id
                         << " failed in execution service: " << *result.internal_error;
            return result;
        }

        execution_result graded = grade(result, expected_output, config.output_limit);
        LOG(INFO) << "Test case " << testcase.index << " of problem " << prob.id << ": " << graded.verdict_name
                  << " (" << timer.duration<chrono::milliseconds>().count() << "ms)";
        return graded;
    } catch (std::exception &ex) {
        LOG(WARNING) << "Test case " << testcase.index << " of problem " << prob.id << " crashed: " << ex.what();
        return execution_result::failure(fmt::format("Test case {}: {}", testcase.index, ex.what()));
    }
}

void fan_out_dispatcher::dispatch(const executable &artifact, const problem &prob,
                                  const function<void(test_case_result &&)> &on_result,
                                  const function<void()> &on_dispatched) const {
    size_t total = prob.test_cases.size();
    for (const test_case &testcase : prob.test_cases) {
        if (!testcase.input || !testcase.output)
            throw internal_error(fmt::format("Test case {} of problem {} has no test data", testcase.index, prob.id));
    }

    vector<thread> workers;
    workers.reserve(total);
    defer {
        for (auto &worker : workers)
            if (worker.joinable()) worker.join();
    };

    try {
        for (const test_case &testcase : prob.test_cases) {
            workers.emplace_back([this, &artifact, &prob, &on_result, &testcase, total] {
                on_result(test_case_result{testcase.index, total, judge_one(artifact, prob, testcase)});
            });
        }
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to start worker for problem " << prob.id << " after "
                   << workers.size() << " of " << total << " test cases: " << ex.what();
        cancel.cancel();
        throw;
    }
    CHECK_EQ(workers.size(), total);
    DLOG(INFO) << "Dispatched " << total << " test cases of problem " << prob.id;
    if (on_dispatched) on_dispatched();
}

}  // namespace streamjudge
