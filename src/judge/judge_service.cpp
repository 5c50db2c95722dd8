#include "judge/judge_service.hpp"
#include <glog/logging.h>

namespace streamjudge {
using namespace std;

judge_service::judge_service(const problem_resolver &resolver, backend::execution_client &client,
                             const configuration &config, const cancellation_token &cancel)
    : resolver(resolver), client(client), config(config), cancel(cancel) {}

unique_ptr<judge_run> judge_service::submit(const judge_submission &submission) const {
    problem prob = resolver.resolve(submission.problem_id);
    LOG(INFO) << "Judging " << submission.language << " submission of " << submission.problem_id
              << " (" << submission.source_code.size() << " bytes) against " << prob.test_cases.size() << " test cases";

    auto run = make_unique<judge_run>(move(prob), submission, client, config, cancel);
    run->start();
    return run;
}

error_codes stream_judge_run(judge_run &run, stream::event_stream_writer &writer) {
    error_codes code = E_SUCCESS;
    while (auto event = run.next()) {
        if (!writer.write(*event)) {
            LOG(WARNING) << "Event stream closed by client after " << writer.written() << " events";
            run.cancel();
            return E_STREAM_CLOSED;
        }
        if (event->type == stream::event_type::ERROR)
            code = E_INTERNAL_ERROR;
    }
    if (run.cancelled()) {
        LOG(WARNING) << "Judge run cancelled after " << writer.written() << " events";
        return E_STREAM_CLOSED;
    }
    return code;
}

}  // namespace streamjudge
