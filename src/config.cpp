#include "config.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace streamjudge {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, configuration &config) {
    assign_optional(j, config.compile_url, "compileUrl");
    assign_optional(j, config.execute_url, "executeUrl");
    assign_optional(j, config.large_input_url, "largeInputUrl");
    assign_optional(j, config.large_input_threshold, "largeInputThreshold");
    assign_optional(j, config.output_limit, "outputLimit");
    assign_optional(j, config.connect_timeout, "connectTimeout");
    assign_optional(j, config.request_timeout, "requestTimeout");
    if (exists(j, "dataDir")) config.data_dir = get_value<string>(j, "dataDir");
    assign_optional(j, config.problem_id_prefix, "problemIdPrefix");
    if (exists(j, "problemSetFile")) config.problem_set_file = get_value<string>(j, "problemSetFile");
    if (exists(j, "testDataMappingFile")) config.test_data_mapping_file = get_value<string>(j, "testDataMappingFile");
    if (exists(j, "testDataDir")) config.test_data_dir = get_value<string>(j, "testDataDir");
}

configuration load_configuration(const filesystem::path &config_path) {
    if (!filesystem::is_regular_file(config_path))
        throw configuration_error("Unable to find configuration file " + config_path.string());

    configuration config;
    try {
        from_json(json::parse(read_file_content(config_path)), config);
    } catch (json::exception &ex) {
        throw configuration_error("Configuration file " + config_path.string() + " is malformed: " + ex.what());
    } catch (invalid_argument &ex) {
        throw configuration_error("Configuration file " + config_path.string() + " is malformed: " + ex.what());
    }
    LOG(INFO) << "Loaded configuration from " << config_path;
    return config;
}

void configuration::validate() const {
    if (compile_url.empty())
        throw configuration_error("Compile url of the execution service is not specified");
    if (execute_url.empty())
        throw configuration_error("Execute url of the execution service is not specified");
    if (large_input_threshold == 0)
        throw configuration_error("largeInputThreshold must be positive");
    if (output_limit == 0)
        throw configuration_error("outputLimit must be positive");
}

filesystem::path configuration::resolve_data_path(const filesystem::path &path) const {
    if (path.is_absolute()) return path;
    return data_dir / path;
}

}  // namespace streamjudge
