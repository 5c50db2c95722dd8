#include "common/net_utils.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include "common/exceptions.hpp"

namespace streamjudge::net {
using namespace std;
using namespace nlohmann;

bool http_response::ok() const {
    return status_code >= 200 && status_code < 300;
}

void global_init() {
    CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
    if (res != CURLE_OK)
        throw network_error(fmt::format("unable to initialize libcurl: {}", curl_easy_strerror(res)));
}

void global_cleanup() {
    curl_global_cleanup();
}

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<string *>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

// 返回非零值时 libcurl 将中止传输，返回 CURLE_ABORTED_BY_CALLBACK
static int check_cancelled(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto *token = static_cast<const cancellation_token *>(clientp);
    return token->cancelled() ? 1 : 0;
}

typedef unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle;
typedef unique_ptr<curl_slist, decltype(&curl_slist_free_all)> curl_headers;

static http_response perform(const string &method, const string &url, CURL *curl, const request_options &options) {
    if (options.cancel.cancelled())
        throw network_error(fmt::format("{} {} cancelled", method, url));

    http_response response{0, ""};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.text);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancelled);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &options.cancel);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout * 1000));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout * 1000));

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw network_error(fmt::format("unable to {} {}, error={}", method, url, curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    DLOG(INFO) << method << ' ' << url << " -> " << response.status_code << ", " << response.text.size() << " bytes";
    return response;
}

static curl_handle make_handle(const string &url) {
    curl_handle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
        throw network_error("unable to initialize curl handle for " + url);
    return curl;
}

http_response post_json(const string &url, const json &post, const request_options &options) {
    curl_handle curl = make_handle(url);
    curl_headers headers(nullptr, curl_slist_free_all);
    headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
    headers.reset(curl_slist_append(headers.release(), "Charset: UTF-8"));

    string body = post.dump(-1, ' ', false, json::error_handler_t::replace);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    return perform("POST", url, curl.get(), options);
}

http_response get(const string &url, const request_options &options) {
    curl_handle curl = make_handle(url);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    return perform("GET", url, curl.get(), options);
}

http_response put(const string &url, const string &content, const request_options &options) {
    curl_handle curl = make_handle(url);
    curl_headers headers(nullptr, curl_slist_free_all);
    headers.reset(curl_slist_append(headers.release(), "Content-Type: application/octet-stream"));

    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, content.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(content.size()));
    return perform("PUT", url, curl.get(), options);
}

http_transport::~http_transport() {}

http_response curl_transport::post_json(const string &url, const json &post, const request_options &options) {
    return net::post_json(url, post, options);
}

http_response curl_transport::get(const string &url, const request_options &options) {
    return net::get(url, options);
}

http_response curl_transport::put(const string &url, const string &content, const request_options &options) {
    return net::put(url, content, options);
}

}  // namespace streamjudge::net
