#include "problem/asset.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace streamjudge {
using namespace std;

asset::asset(const string &name) : name(name) {}

asset::~asset() {}

local_asset::local_asset(const string &name, const filesystem::path &path)
    : asset(name), path(path) {}

string local_asset::read(const cancellation_token &) const {
    if (!filesystem::is_regular_file(path))
        throw internal_error(fmt::format("Test data {} does not exist at {}", name, path.string()));
    return read_file_content(path);
}

text_asset::text_asset(const string &name, const string &text)
    : asset(name), text(text) {}

string text_asset::read(const cancellation_token &) const {
    return text;
}

remote_asset::remote_asset(const string &name, const string &url, const net::request_options &options)
    : asset(name), url(url), options(options) {}

string remote_asset::read(const cancellation_token &cancel) const {
    net::request_options transfer = options;
    transfer.cancel = cancel;
    net::http_response response = net::get(url, transfer);
    if (!response.ok())
        throw network_error(fmt::format("unable to download {} from {}, status code={}", name, url, response.status_code));
    return response.text;
}

}  // namespace streamjudge
