#pragma once

#include <string>
#include "common/net_utils.hpp"
#include "gmock/gmock.h"

namespace streamjudge::test {

struct mock_http_transport : public net::http_transport {
    MOCK_METHOD(net::http_response, post_json, (const std::string &, const nlohmann::json &, const net::request_options &), (override));
    MOCK_METHOD(net::http_response, get, (const std::string &, const net::request_options &), (override));
    MOCK_METHOD(net::http_response, put, (const std::string &, const std::string &, const net::request_options &), (override));
};

}  // namespace streamjudge::test
