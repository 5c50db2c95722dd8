#include "judge/grader.hpp"
#include <boost/algorithm/string/trim.hpp>
#include "common/io_utils.hpp"

namespace streamjudge {
using namespace std;
using backend::execution_result;

bool outputs_match(const string &program_output, const string &expected_output) {
    return boost::algorithm::trim_copy(program_output) == boost::algorithm::trim_copy(expected_output);
}

const string &program_output(const execution_result &result) {
    if (result.file_output && !result.file_output->empty())
        return *result.file_output;
    return result.standard_output;
}

execution_result regrade(const execution_result &result, const string &expected_output) {
    execution_result graded = result;
    if (result.is_internal_error()) return graded;

    if (result.get_verdict() == verdict::ACCEPTED && !outputs_match(program_output(result), expected_output))
        graded.verdict_name = verdict_name(verdict::WRONG_ANSWER);
    return graded;
}

execution_result truncate_output(const execution_result &result, size_t limit) {
    execution_result truncated = result;
    truncated.standard_output = utf8_truncate(result.standard_output, limit);
    truncated.standard_error = utf8_truncate(result.standard_error, limit);
    if (result.file_output)
        truncated.file_output = utf8_truncate(*result.file_output, limit);
    return truncated;
}

execution_result grade(const execution_result &result, const string &expected_output, size_t limit) {
    return truncate_output(regrade(result, expected_output), limit);
}

}  // namespace streamjudge
