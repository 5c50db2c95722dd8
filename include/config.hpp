#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace streamjudge {

/**
 * @brief 命令行程序的退出码
 */
enum error_codes {
    E_SUCCESS = 0,
    E_INTERNAL_ERROR = 2,
    E_INVALID_ARGUMENT = 3,
    E_NOT_FOUND = 4,
    E_STREAM_CLOSED = 5
};

/**
 * @brief 评测编排器的全局配置
 * 由 main 从配置文件、命令行参数、环境变量中构造，显式传给需要它的组件。
 *
 * 配置文件格式（所有字段可选）：
 * {
 *     "compileUrl": "https://.../compile",
 *     "executeUrl": "https://.../execute",
 *     "largeInputUrl": "https://.../large-input",
 *     "largeInputThreshold": 2000000,
 *     "outputLimit": 10000,
 *     "connectTimeout": 10,
 *     "requestTimeout": 300,
 *     "dataDir": "data_private",
 *     "problemIdPrefix": "usaco-",
 *     "problemSetFile": "usaco/problems.json",
 *     "testDataMappingFile": "probgate/usaco_to_probgate_mapping.json",
 *     "testDataDir": "probgate/problems"
 * }
 */
struct configuration {
    /**
     * @brief 执行服务的编译接口地址
     */
    std::string compile_url;

    /**
     * @brief 执行服务的运行接口地址
     */
    std::string execute_url;

    /**
     * @brief 执行服务申请大输入上传地址的接口
     */
    std::string large_input_url;

    /**
     * @brief 输入数据达到该字节数时不再内联在请求中，而是先上传再传递引用 id
     * 执行服务对请求体大小有上限
     */
    std::size_t large_input_threshold = 2000000;

    /**
     * @brief 返回给客户端的 stdout、stderr、file_output 的最大字符数
     * 仅用于展示，评测使用未截断的内容
     */
    std::size_t output_limit = 10000;

    /**
     * @brief 建立连接的时间限制，单位为秒
     */
    double connect_timeout = 10;

    /**
     * @brief 单次远程调用的时间限制，单位为秒，0 表示不限制
     */
    double request_timeout = 300;

    /**
     * @brief 题目数据的根目录
     *
     * DATA_DIR
     * ├── usaco
     * │   └── problems.json // 题库，键为题目编号
     * └── probgate
     *     ├── usaco_to_probgate_mapping.json // 题目编号到测试数据编号的映射
     *     └── problems
     *         └── 1001 // 测试数据编号
     *             ├── config.json // 时间限制、文件名、测试点列表
     *             ├── 1.in
     *             └── 1.out
     */
    std::filesystem::path data_dir = "data_private";

    /**
     * @brief 题目编号必须带有的前缀，查找题目前会被去掉
     */
    std::string problem_id_prefix = "usaco-";

    /**
     * @brief 以下路径若为相对路径，则相对于 data_dir
     */
    std::filesystem::path problem_set_file = "usaco/problems.json";

    std::filesystem::path test_data_mapping_file = "probgate/usaco_to_probgate_mapping.json";

    std::filesystem::path test_data_dir = "probgate/problems";

    /**
     * @brief 检查配置是否完整
     * @throws configuration_error 若缺少执行服务地址等必须项
     */
    void validate() const;

    /**
     * @brief 将相对于 data_dir 的路径转换为实际路径
     */
    std::filesystem::path resolve_data_path(const std::filesystem::path &path) const;
};

void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 从配置文件读取配置
 * @throws configuration_error 若文件不存在或格式错误
 */
configuration load_configuration(const std::filesystem::path &config_path);

}  // namespace streamjudge
