#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "problem/problem_resolver.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace std::filesystem;
using namespace nlohmann;
using namespace streamjudge;

class ProblemResolverTest : public ::testing::Test {
protected:
    path datadir;
    configuration config;

    void SetUp() override {
        datadir = temp_directory_path() / ("streamjudge-resolver-" + to_string(::getpid()) + "-" +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        create_directories(datadir / "usaco");
        create_directories(datadir / "probgate" / "problems" / "1001-data");
        config.data_dir = datadir;

        write("usaco/problems.json", json{{"1001", {{"name", "Cow Jump"}, {"division", "silver"}}},
                                          {"1002", {{"name", "Milk Pails"}}},
                                          {"1003", {{"name", "Fence Painting"}}}}
                                         .dump());
        write("probgate/usaco_to_probgate_mapping.json", json{{"1001", "1001-data"}, {"1003", nullptr}}.dump());
        write("probgate/problems/1001-data/config.json", json{{"time_limit_ms", 2000},
                                                              {"shortname", "cowjump"},
                                                              {"tests", {{{"input", "1.in"}, {"output", "1.out"}},
                                                                         {{"input", "2.in"}, {"output", "2.out"}}}}}
                                                             .dump());
        write("probgate/problems/1001-data/1.in", "1 2\n");
        write("probgate/problems/1001-data/1.out", "3\n");
        write("probgate/problems/1001-data/2.in", "5 7\n");
        write("probgate/problems/1001-data/2.out", "12\n");
    }

    void TearDown() override {
        remove_all(datadir);
    }

    void write(const string &subpath, const string &content) {
        ofstream fout(datadir / subpath, ios::binary);
        fout << content;
    }
};

TEST_F(ProblemResolverTest, ResolvesTestCasesInOrder) {
    local_problem_resolver resolver(config);
    problem prob = resolver.resolve("usaco-1001");

    EXPECT_EQ("1001", prob.id);
    EXPECT_EQ("1001-data", prob.test_data_id);
    EXPECT_EQ(2000, prob.time_limit_ms);
    EXPECT_EQ("cowjump", prob.file_io_name);
    EXPECT_EQ("Cow Jump", prob.metadata.at("name").get<string>());
    ASSERT_EQ(2u, prob.test_cases.size());

    EXPECT_EQ(1u, prob.test_cases[0].index);
    EXPECT_EQ("1 2\n", prob.test_cases[0].input->read(cancellation_token()));
    EXPECT_EQ("3\n", prob.test_cases[0].output->read(cancellation_token()));
    EXPECT_EQ(2u, prob.test_cases[1].index);
    EXPECT_EQ("5 7\n", prob.test_cases[1].input->read(cancellation_token()));
    EXPECT_EQ("12\n", prob.test_cases[1].output->read(cancellation_token()));
}

TEST_F(ProblemResolverTest, RejectsMissingPrefix) {
    local_problem_resolver resolver(config);
    try {
        resolver.resolve("1001");
        FAIL() << "problem id without prefix should be rejected";
    } catch (invalid_problem_id &ex) {
        EXPECT_STREQ("Problem ID must start with 'usaco-'", ex.what());
    }
}

TEST_F(ProblemResolverTest, UnknownProblem) {
    local_problem_resolver resolver(config);
    try {
        resolver.resolve("usaco-9999");
        FAIL() << "unknown problem should be rejected";
    } catch (problem_not_found &ex) {
        EXPECT_STREQ("Problem usaco-9999 not found", ex.what());
    }
}

TEST_F(ProblemResolverTest, ProblemWithoutTestData) {
    local_problem_resolver resolver(config);
    EXPECT_THROW(resolver.resolve("usaco-1002"), test_data_not_found);
    try {
        resolver.resolve("usaco-1003");
        FAIL() << "problem mapped to null should be rejected";
    } catch (test_data_not_found &ex) {
        EXPECT_STREQ("We don't have test data for this problem yet.", ex.what());
        EXPECT_EQ("usaco-1003", ex.problem_id);
    }
}

TEST_F(ProblemResolverTest, MissingTestFileFailsOnRead) {
    std::filesystem::remove(datadir / "probgate/problems/1001-data/2.out");
    local_problem_resolver resolver(config);
    problem prob = resolver.resolve("usaco-1001");
    ASSERT_EQ(2u, prob.test_cases.size());
    EXPECT_EQ("3\n", prob.test_cases[0].output->read(cancellation_token()));
    EXPECT_THROW(prob.test_cases[1].output->read(cancellation_token()), internal_error);
}

TEST_F(ProblemResolverTest, RejectsUnsafeTestPath) {
    write("probgate/problems/1001-data/config.json",
          json{{"time_limit_ms", 1000}, {"tests", {{{"input", "../../../usaco/problems.json"}, {"output", "1.out"}}}}}.dump());
    local_problem_resolver resolver(config);
    EXPECT_THROW(resolver.resolve("usaco-1001"), internal_error);
}

TEST_F(ProblemResolverTest, MalformedTestDataConfiguration) {
    write("probgate/problems/1001-data/config.json", json{{"tests", json::array()}}.dump());
    local_problem_resolver resolver(config);
    EXPECT_THROW(resolver.resolve("usaco-1001"), internal_error);

    write("probgate/problems/1001-data/config.json", "{ not json");
    EXPECT_THROW(resolver.resolve("usaco-1001"), internal_error);
}

TEST_F(ProblemResolverTest, RemoteReferencesAreNotReadLocally) {
    write("probgate/problems/1001-data/config.json",
          json{{"time_limit_ms", 1000}, {"tests", {{{"input", "https://storage.example.com/1.in"}, {"output", "1.out"}}}}}.dump());
    local_problem_resolver resolver(config);
    problem prob = resolver.resolve("usaco-1001");
    ASSERT_EQ(1u, prob.test_cases.size());
    auto input = dynamic_pointer_cast<const remote_asset>(prob.test_cases[0].input);
    ASSERT_NE(nullptr, input);
    EXPECT_EQ("https://storage.example.com/1.in", input->url);
    EXPECT_NE(nullptr, dynamic_pointer_cast<const local_asset>(prob.test_cases[0].output));
}

TEST(RemoteAssetTest, CancelledReadFailsFast) {
    net::request_options options;
    options.timeout = 0;
    remote_asset input("1.in", "https://storage.example.com/1.in", options);

    cancellation_token cancel;
    cancel.cancel();
    try {
        input.read(cancel);
        FAIL() << "cancelled download should not start";
    } catch (network_error &ex) {
        EXPECT_NE(string::npos, string(ex.what()).find("cancelled"));
    }
}

TEST_F(ProblemResolverTest, ConfiguredPrefix) {
    config.problem_id_prefix = "cf-";
    local_problem_resolver resolver(config);
    EXPECT_EQ(2u, resolver.resolve("cf-1001").test_cases.size());
    EXPECT_THROW(resolver.resolve("usaco-1001"), invalid_problem_id);
}

TEST_F(ProblemResolverTest, ListsProblemSet) {
    local_problem_resolver resolver(config);
    json problems = resolver.list_problems();
    ASSERT_TRUE(problems.is_object());
    EXPECT_EQ(3u, problems.size());
    EXPECT_JSON_EQ((json{{"name", "Milk Pails"}}), problems.at("1002"));
}

TEST(ProblemIdTest, StripsPrefix) {
    EXPECT_EQ("1001", strip_problem_id_prefix("usaco-1001", "usaco-"));
    EXPECT_EQ("", strip_problem_id_prefix("usaco-", "usaco-"));
    EXPECT_THROW(strip_problem_id_prefix("USACO-1001", "usaco-"), invalid_problem_id);
    EXPECT_THROW(strip_problem_id_prefix("", "usaco-"), invalid_problem_id);
}
