#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include "backend/http_execution_client.hpp"
#include "common/cancellation.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/net_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/judge_service.hpp"
#include "problem/problem_resolver.hpp"
#include "stream/event_stream.hpp"
using namespace std;

// 进程内只有一次评测，收到 SIGINT/SIGTERM 时取消它
// 信号处理函数中只设置标记，judge_run::next 发现标记后关闭事件流
static streamjudge::cancellation_token global_cancel;

void stopHandler(int /* signum */) {
    global_cancel.cancel();
}

/**
 * @brief 在开始输出事件流之前拒绝请求
 * 错误信息以 json 的形式写到 stderr，stdout 不会有任何输出
 */
static int reject(int status_code, const string& detail, int exit_code) {
    LOG(WARNING) << "Rejected: " << detail;
    cerr << nlohmann::json{{"status_code", status_code}, {"detail", detail}}.dump() << endl;
    return exit_code;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;  // stdout 用于输出事件流

    namespace po = boost::program_options;
    po::options_description desc("streamjudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem", po::value<string>(), "problem id to judge against, for example usaco-1001")
        ("source", po::value<string>(), "path of the source file to be judged")
        ("language", po::value<string>()->default_value("cpp"), "language of the source file")
        ("compiler-options", po::value<string>()->default_value(""), "options passed to the compiler")
        ("config", po::value<string>(), "configuration file in json format. You can either pass it from environ STREAMJUDGE_CONFIG")
        ("data-dir", po::value<string>(), "set the directory storing problems and test data. You can either pass it from environ DATADIR")
        ("compile-url", po::value<string>(), "set the compile endpoint of the execution service. You can either pass it from environ COMPILE_URL")
        ("execute-url", po::value<string>(), "set the execute endpoint of the execution service. You can either pass it from environ EXECUTE_URL")
        ("large-input-url", po::value<string>(), "set the endpoint requesting upload slots for large inputs. You can either pass it from environ LARGE_INPUT_URL")
        ("large-input-threshold", po::value<size_t>(), "inputs with at least this many bytes are uploaded instead of being inlined, default to 2000000")
        ("output-limit", po::value<size_t>(), "maximum number of characters of stdout, stderr and file output returned, default to 10000")
        ("list-problems", "print the problem set and exit")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return streamjudge::E_INVALID_ARGUMENT;
    }

    if (vm.count("help")) {
        cout << "streamjudge: compile a submission with the execution service, run it against every test case of the problem" << endl
             << "and stream the results to stdout as text/event-stream records" << endl
             << "Usage: " << argv[0] << " --problem <id> --source <file> [options]" << endl;
        cout << desc << endl;
        return streamjudge::E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "streamjudge 1.0" << endl;
        return streamjudge::E_SUCCESS;
    }

    streamjudge::configuration config;
    try {
        string config_path = vm.count("config") ? vm.at("config").as<string>() : streamjudge::get_env("STREAMJUDGE_CONFIG", "");
        if (!config_path.empty())
            config = streamjudge::load_configuration(config_path);
    } catch (streamjudge::configuration_error& ex) {
        cerr << ex.what() << endl;
        return streamjudge::E_INVALID_ARGUMENT;
    }

    if (vm.count("data-dir")) {
        config.data_dir = vm.at("data-dir").as<string>();
    } else if (getenv("DATADIR")) {
        config.data_dir = getenv("DATADIR");
    }

    if (vm.count("compile-url")) {
        config.compile_url = vm.at("compile-url").as<string>();
    } else if (getenv("COMPILE_URL")) {
        config.compile_url = getenv("COMPILE_URL");
    }

    if (vm.count("execute-url")) {
        config.execute_url = vm.at("execute-url").as<string>();
    } else if (getenv("EXECUTE_URL")) {
        config.execute_url = getenv("EXECUTE_URL");
    }

    if (vm.count("large-input-url")) {
        config.large_input_url = vm.at("large-input-url").as<string>();
    } else if (getenv("LARGE_INPUT_URL")) {
        config.large_input_url = getenv("LARGE_INPUT_URL");
    }

    if (vm.count("large-input-threshold"))
        config.large_input_threshold = vm.at("large-input-threshold").as<size_t>();

    if (vm.count("output-limit"))
        config.output_limit = vm.at("output-limit").as<size_t>();

    streamjudge::local_problem_resolver resolver(config);

    if (vm.count("list-problems")) {
        try {
            cout << resolver.list_problems().dump(2) << endl;
            return streamjudge::E_SUCCESS;
        } catch (streamjudge::judge_exception& ex) {
            cerr << ex.what() << endl;
            return streamjudge::E_INTERNAL_ERROR;
        }
    }

    if (!vm.count("problem") || !vm.count("source")) {
        cerr << "--problem and --source are required" << endl
             << endl;
        cerr << desc << endl;
        return streamjudge::E_INVALID_ARGUMENT;
    }

    try {
        config.validate();
    } catch (streamjudge::configuration_error& ex) {
        cerr << ex.what() << endl;
        return streamjudge::E_INVALID_ARGUMENT;
    }

    streamjudge::judge_submission submission;
    submission.problem_id = vm.at("problem").as<string>();
    submission.language = vm.at("language").as<string>();
    submission.compiler_options = vm.at("compiler-options").as<string>();
    try {
        submission.source_code = streamjudge::read_file_content(vm.at("source").as<string>());
    } catch (streamjudge::internal_error& ex) {
        return reject(400, ex.what(), streamjudge::E_INVALID_ARGUMENT);
    }

    // 客户端关闭管道时 write 返回 EPIPE，由 event_stream_writer 发现并取消评测
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, stopHandler);
    signal(SIGTERM, stopHandler);

    try {
        streamjudge::net::global_init();
        defer { streamjudge::net::global_cleanup(); };

        streamjudge::backend::http_execution_client client(config, global_cancel);
        streamjudge::judge_service service(resolver, client, config, global_cancel);

        unique_ptr<streamjudge::judge_run> run;
        try {
            run = service.submit(submission);
        } catch (streamjudge::invalid_problem_id& ex) {
            return reject(400, ex.what(), streamjudge::E_INVALID_ARGUMENT);
        } catch (streamjudge::test_data_not_found& ex) {
            LOG(WARNING) << "No test data mapped for " << ex.problem_id;
            return reject(404, ex.what(), streamjudge::E_NOT_FOUND);
        } catch (streamjudge::not_found_error& ex) {
            return reject(404, ex.what(), streamjudge::E_NOT_FOUND);
        }

        streamjudge::stream::event_stream_writer writer(cout);
        return streamjudge::stream_judge_run(*run, writer);
    } catch (std::exception& ex) {
        LOG(ERROR) << "Judge crashed: " << boost::diagnostic_information(ex);
        return streamjudge::E_INTERNAL_ERROR;
    }
}
