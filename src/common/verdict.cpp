#include "common/verdict.hpp"
#include <unordered_map>

namespace streamjudge {
using namespace std;

// clang-format off
static const unordered_map<string, verdict> verdict_names = {
    {"accepted", verdict::ACCEPTED},
    {"wrong_answer", verdict::WRONG_ANSWER},
    {"runtime_error", verdict::RUNTIME_ERROR},
    {"time_limit_exceeded", verdict::TIME_LIMIT_EXCEEDED},
    {"memory_limit_exceeded", verdict::MEMORY_LIMIT_EXCEEDED},
    {"output_limit_exceeded", verdict::OUTPUT_LIMIT_EXCEEDED},
    {"compile_error", verdict::COMPILE_ERROR}
};
// clang-format on

verdict parse_verdict(const string &name) {
    auto it = verdict_names.find(name);
    return it == verdict_names.end() ? verdict::OTHER : it->second;
}

const char *verdict_name(verdict value) {
    switch (value) {
        case verdict::ACCEPTED: return "accepted";
        case verdict::WRONG_ANSWER: return "wrong_answer";
        case verdict::RUNTIME_ERROR: return "runtime_error";
        case verdict::TIME_LIMIT_EXCEEDED: return "time_limit_exceeded";
        case verdict::MEMORY_LIMIT_EXCEEDED: return "memory_limit_exceeded";
        case verdict::OUTPUT_LIMIT_EXCEEDED: return "output_limit_exceeded";
        case verdict::COMPILE_ERROR: return "compile_error";
        default: return "other";
    }
}

}  // namespace streamjudge
