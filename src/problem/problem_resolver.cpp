#include "problem/problem_resolver.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace streamjudge {
using namespace std;
using namespace nlohmann;

problem_resolver::~problem_resolver() {}

string strip_problem_id_prefix(const string &problem_id, const string &prefix) {
    if (!boost::algorithm::starts_with(problem_id, prefix))
        throw invalid_problem_id(fmt::format("Problem ID must start with '{}'", prefix));
    return problem_id.substr(prefix.size());
}

static json read_json_file(const filesystem::path &path) {
    try {
        return json::parse(read_file_content(path));
    } catch (json::exception &ex) {
        throw internal_error(fmt::format("{} is malformed: {}", path.string(), ex.what()));
    }
}

/**
 * @brief 解析测试点中的文件引用
 * http:// 或 https:// 开头的引用需要下载，其他引用是相对测试数据目录的路径
 */
static asset_ptr make_test_asset(const string &reference, const filesystem::path &dir, const net::request_options &options) {
    if (boost::algorithm::starts_with(reference, "http://") || boost::algorithm::starts_with(reference, "https://"))
        return make_shared<remote_asset>(reference, reference, options);
    return make_shared<local_asset>(reference, dir / assert_safe_path(reference));
}

local_problem_resolver::local_problem_resolver(const configuration &config)
    : config(config) {}

json local_problem_resolver::list_problems() const {
    return read_json_file(config.resolve_data_path(config.problem_set_file));
}

problem local_problem_resolver::resolve(const string &problem_id) const {
    string id = strip_problem_id_prefix(problem_id, config.problem_id_prefix);

    json problems = list_problems();
    if (!problems.is_object() || !problems.count(id))
        throw problem_not_found(problem_id);

    json mapping = read_json_file(config.resolve_data_path(config.test_data_mapping_file));
    if (!mapping.is_object() || !mapping.count(id) || mapping.at(id).is_null())
        throw test_data_not_found(problem_id);

    problem prob;
    prob.id = id;
    prob.metadata = problems.at(id);
    if (mapping.at(id).is_string())
        prob.test_data_id = mapping.at(id).get<string>();
    else
        prob.test_data_id = mapping.at(id).dump();
    assert_safe_path(prob.test_data_id);

    filesystem::path dir = config.resolve_data_path(config.test_data_dir) / prob.test_data_id;
    json problem_config = read_json_file(dir / "config.json");

    // 取消标记由评测线程在读取测试数据时传入
    net::request_options options;
    options.connect_timeout = config.connect_timeout;
    options.timeout = config.request_timeout;

    try {
        prob.time_limit_ms = get_value<int>(problem_config, "time_limit_ms");
        prob.file_io_name = get_value_def<string>(problem_config, "", "shortname");
        size_t index = 0;
        for (auto &test : access(problem_config, "tests")) {
            test_case testcase;
            testcase.index = ++index;
            testcase.input = make_test_asset(get_value<string>(test, "input"), dir, options);
            testcase.output = make_test_asset(get_value<string>(test, "output"), dir, options);
            prob.test_cases.push_back(move(testcase));
        }
    } catch (invalid_argument &ex) {
        throw internal_error(fmt::format("Test data configuration of {} is malformed: {}", problem_id, ex.what()));
    }

    LOG(INFO) << "Resolved problem " << problem_id << " to test data " << prob.test_data_id
              << " with " << prob.test_cases.size() << " test cases";
    return prob;
}

}  // namespace streamjudge
