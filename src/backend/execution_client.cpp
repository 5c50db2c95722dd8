#include "backend/execution_client.hpp"
#include "common/json_utils.hpp"

namespace streamjudge::backend {
using namespace std;
using namespace nlohmann;

bool compile_result::success() const {
    return artifact.has_value() && !artifact->is_null();
}

void to_json(json &j, const compile_result &result) {
    if (result.internal_error && result.raw.is_null())
        j = {{"internal_error", *result.internal_error}};
    else
        j = result.raw;
}

void to_json(json &j, const execution_request &request) {
    json options = {{"timeout_ms", request.timeout_ms},
                    {"file_io_name", request.file_io_name}};
    if (request.input.input_id)
        options["stdin_id"] = *request.input.input_id;
    else
        options["stdin"] = request.input.content.value_or("");

    j = {{"executable", request.artifact},
         {"options", options}};
}

bool execution_result::is_internal_error() const {
    return internal_error.has_value();
}

streamjudge::verdict execution_result::get_verdict() const {
    return parse_verdict(verdict_name);
}

execution_result execution_result::failure(const string &message) {
    execution_result result;
    result.internal_error = message;
    return result;
}

void to_json(json &j, const execution_result &result) {
    if (result.internal_error) {
        j = {{"internal_error", *result.internal_error}};
        return;
    }

    j = result.extra.is_object() ? result.extra : json::object();
    j["verdict"] = result.verdict_name;
    j["stdout"] = result.standard_output;
    j["stderr"] = result.standard_error;
    if (result.file_output)
        j["file_output"] = *result.file_output;
    else
        j["file_output"] = nullptr;
}

void from_json(const json &j, large_input_slot &slot) {
    slot.presigned_url = get_value<string>(j, "presigned_url");
    slot.input_id = get_value<string>(j, "input_id");
}

execution_client::~execution_client() {}

}  // namespace streamjudge::backend
