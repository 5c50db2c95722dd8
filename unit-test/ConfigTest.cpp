#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace std::filesystem;
using namespace nlohmann;
using namespace streamjudge;

static path write_config(const string &name, const string &content) {
    path file = temp_directory_path() / ("streamjudge-" + to_string(::getpid()) + "-" + name + ".json");
    ofstream fout(file);
    fout << content;
    return file;
}

TEST(ConfigTest, Defaults) {
    configuration config;
    EXPECT_EQ(2000000u, config.large_input_threshold);
    EXPECT_EQ(10000u, config.output_limit);
    EXPECT_EQ("usaco-", config.problem_id_prefix);
    EXPECT_EQ(path("data_private/usaco/problems.json"), config.resolve_data_path(config.problem_set_file));
    EXPECT_EQ(path("/srv/problems.json"), config.resolve_data_path("/srv/problems.json"));
}

TEST(ConfigTest, LoadsFromFile) {
    path file = write_config("load", json{{"compileUrl", "https://sandbox.example.com/compile"},
                                          {"executeUrl", "https://sandbox.example.com/execute"},
                                          {"largeInputThreshold", 1024},
                                          {"dataDir", "/srv/judge"},
                                          {"problemIdPrefix", "cf-"}}
                                         .dump());
    configuration config = load_configuration(file);
    std::filesystem::remove(file);

    EXPECT_EQ("https://sandbox.example.com/compile", config.compile_url);
    EXPECT_EQ("https://sandbox.example.com/execute", config.execute_url);
    EXPECT_EQ("", config.large_input_url);
    EXPECT_EQ(1024u, config.large_input_threshold);
    EXPECT_EQ(10000u, config.output_limit);
    EXPECT_EQ(path("/srv/judge"), config.data_dir);
    EXPECT_EQ("cf-", config.problem_id_prefix);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, RejectsMalformedFile) {
    EXPECT_THROW(load_configuration("/nonexistent/streamjudge.json"), configuration_error);

    path broken = write_config("broken", "{\"compileUrl\": ");
    EXPECT_THROW(load_configuration(broken), configuration_error);
    std::filesystem::remove(broken);

    path mistyped = write_config("mistyped", json{{"outputLimit", "many"}}.dump());
    EXPECT_THROW(load_configuration(mistyped), configuration_error);
    std::filesystem::remove(mistyped);
}

TEST(ConfigTest, ValidateRequiresEndpoints) {
    configuration config;
    EXPECT_THROW(config.validate(), configuration_error);
    config.compile_url = "https://sandbox.example.com/compile";
    EXPECT_THROW(config.validate(), configuration_error);
    config.execute_url = "https://sandbox.example.com/execute";
    EXPECT_NO_THROW(config.validate());
    config.output_limit = 0;
    EXPECT_THROW(config.validate(), configuration_error);
}
