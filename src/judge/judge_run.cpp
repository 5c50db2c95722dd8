#include "judge/judge_run.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "judge/dispatcher.hpp"

namespace streamjudge {
using namespace std;
using namespace nlohmann;
using namespace streamjudge::backend;

const char *state_name(run_state state) {
    switch (state) {
        case run_state::CREATED: return "created";
        case run_state::COMPILING: return "compiling";
        case run_state::COMPILE_FAILED: return "compile_failed";
        case run_state::DISPATCHING: return "dispatching";
        case run_state::STREAMING: return "streaming";
        default: return "done";
    }
}

judge_run::judge_run(problem prob, judge_submission submit, execution_client &client,
                     const configuration &config, const cancellation_token &cancel)
    : prob(move(prob)), submit(move(submit)), client(client), config(config), cancellation(cancel), current_state(run_state::CREATED) {}

judge_run::~judge_run() {
    if (coordinator.joinable()) {
        if (state() != run_state::DONE && state() != run_state::COMPILE_FAILED)
            cancel();
        coordinator.join();
    }
}

void judge_run::start() {
    if (coordinator.joinable() || state() != run_state::CREATED)
        throw internal_error("Judge run of " + submit.problem_id + " has already been started");
    coordinator = thread([this] { run(); });
}

// 等待事件时检查取消标记的间隔
static const chrono::milliseconds cancellation_poll_interval(50);

optional<stream::stream_event> judge_run::next() {
    while (!events.drained()) {
        if (cancellation.cancelled()) {
            if (!events.closed()) cancel();
            return nullopt;
        }
        if (auto event = events.pop_for(cancellation_poll_interval))
            return event;
    }
    return nullopt;
}

void judge_run::cancel() {
    LOG(WARNING) << "Cancelling judge run of " << submit.problem_id << " in state " << state_name(state());
    cancellation.cancel();
    events.close();
    events.clear();
}

bool judge_run::cancelled() const {
    return cancellation.cancelled();
}

run_state judge_run::state() const {
    return current_state.load();
}

const problem &judge_run::get_problem() const {
    return prob;
}

void judge_run::set_state(run_state state) {
    DLOG(INFO) << "Judge run of " << submit.problem_id << ": " << state_name(current_state.load()) << " -> " << state_name(state);
    current_state.store(state);
}

void judge_run::run() {
    set_state(run_state::COMPILING);
    compile_result compiled;
    try {
        compiled = client.compile(compile_request{submit.source_code, submit.compiler_options, submit.language});
    } catch (std::exception &ex) {
        LOG(ERROR) << "Compiling submission of " << submit.problem_id << " crashed: " << boost::diagnostic_information(ex);
        compiled = compile_result();
        compiled.internal_error = ex.what();
    }
    events.push(stream::make_compile_event(compiled));

    if (!compiled.success()) {
        LOG(INFO) << "Submission of " << submit.problem_id << " did not compile";
        set_state(run_state::COMPILE_FAILED);
        events.close();
        return;
    }

    set_state(run_state::DISPATCHING);
    try {
        fan_out_dispatcher dispatcher(client, config, cancellation);
        dispatcher.dispatch(
            *compiled.artifact, prob,
            [this](test_case_result &&result) {
                events.push(stream::make_execute_event(json(result)));
            },
            [this] { set_state(run_state::STREAMING); });
    } catch (std::exception &ex) {
        LOG(ERROR) << "Judge run of " << submit.problem_id << " crashed: " << boost::diagnostic_information(ex);
        events.push(stream::make_error_event(ex));
    }

    set_state(run_state::DONE);
    events.close();
    LOG(INFO) << "Judge run of " << submit.problem_id << " finished";
}

}  // namespace streamjudge
