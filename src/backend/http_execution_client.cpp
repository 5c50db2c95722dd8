#include "backend/http_execution_client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/json_utils.hpp"

namespace streamjudge::backend {
using namespace std;
using namespace nlohmann;

// 这些字段由 execution_result 单独保存，其余字段放进 extra
static const char *const known_result_fields[] = {"verdict", "stdout", "stderr", "file_output", "full_output_url", "internal_error"};

static string describe_internal_error(const json &value) {
    return value.is_string() ? value.get<string>() : value.dump();
}

compile_result decode_compile_response(const string &text) {
    compile_result result;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        result.internal_error = text;
        return result;
    }

    result.raw = j;
    if (exists(j, "internal_error"))
        result.internal_error = describe_internal_error(j.at("internal_error"));
    if (exists(j, "executable"))
        result.artifact = j.at("executable");
    if (exists(j, "compile_output") && j.at("compile_output").is_string())
        result.compile_output = j.at("compile_output").get<string>();
    return result;
}

execution_result decode_execution_response(const string &text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return execution_result::failure(text);

    if (exists(j, "internal_error"))
        return execution_result::failure(describe_internal_error(j.at("internal_error")));

    if (!exists(j, "verdict") || !j.at("verdict").is_string())
        return execution_result::failure(text);

    execution_result result;
    result.verdict_name = j.at("verdict").get<string>();
    result.standard_output = get_value_def<string>(j, "", "stdout");
    result.standard_error = get_value_def<string>(j, "", "stderr");
    if (exists(j, "file_output") && j.at("file_output").is_string())
        result.file_output = j.at("file_output").get<string>();

    result.extra = j;
    for (const char *field : known_result_fields)
        result.extra.erase(field);
    return result;
}

http_execution_client::http_execution_client(const configuration &config, const cancellation_token &cancel)
    : http_execution_client(config, cancel, make_shared<net::curl_transport>()) {}

http_execution_client::http_execution_client(const configuration &config, const cancellation_token &cancel,
                                             shared_ptr<net::http_transport> transport)
    : config(config), transport(move(transport)) {
    options.connect_timeout = config.connect_timeout;
    options.timeout = config.request_timeout;
    options.cancel = cancel;
}

compile_result http_execution_client::compile(const compile_request &request) {
    json body = {{"source_code", request.source_code},
                 {"compiler_options", request.compiler_options},
                 {"language", request.language}};

    auto response = capture_remote("compile", [&] {
        return transport->post_json(config.compile_url, body, options);
    });
    if (!response.ok()) {
        compile_result result;
        result.internal_error = response.error();
        return result;
    }

    compile_result result = decode_compile_response(response.value().text);
    LOG(INFO) << "Compiled " << request.language << " submission, status code " << response.value().status_code
              << (result.success() ? ", succeeded" : ", failed");
    return result;
}

execution_result http_execution_client::execute(const execution_request &request) {
    auto response = capture_remote("execute", [&] {
        return transport->post_json(config.execute_url, json(request), options);
    });
    if (!response.ok())
        return execution_result::failure(response.error());

    string text = response.value().text;
    json j = json::parse(text, nullptr, false);
    if (!j.is_discarded() && exists(j, "full_output_url")) {
        // 执行结果太大，执行服务没有直接返回，需要另外下载
        auto full_output = capture_remote("fetch full output", [&] {
            string url = get_value<string>(j, "full_output_url");
            net::http_response full = transport->get(url, options);
            if (!full.ok())
                throw network_error(fmt::format("unable to download full output from {}, status code={}", url, full.status_code));
            return full.text;
        });
        if (!full_output.ok())
            return execution_result::failure(full_output.error());
        text = full_output.value();
    }

    return decode_execution_response(text);
}

remote_result<large_input_slot> http_execution_client::request_large_input_slot() {
    if (config.large_input_url.empty())
        return remote_failure{"large input url of the execution service is not configured"};

    return capture_remote("request large input slot", [&] {
        net::http_response response = transport->post_json(config.large_input_url, json::object(), options);
        if (!response.ok())
            throw network_error(fmt::format("unable to request large input slot, status code={}, body={}", response.status_code, response.text));
        return json::parse(response.text).get<large_input_slot>();
    });
}

remote_result<long> http_execution_client::upload_large_input(const large_input_slot &slot, const string &content) {
    return capture_remote("upload large input", [&] {
        net::http_response response = transport->put(slot.presigned_url, content, options);
        if (!response.ok())
            throw network_error(fmt::format("unable to upload large input {}, status code={}", slot.input_id, response.status_code));
        return response.status_code;
    });
}

}  // namespace streamjudge::backend
