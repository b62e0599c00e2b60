#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/model.hpp"

namespace grader {

/**
 * @brief 单次评测的配置
 * 由调用者按值传入，引擎内部没有全局配置
 */
struct evaluation_config {
    /**
     * @brief 测试执行（包括测试程序的构建）的时间上限
     */
    std::chrono::milliseconds timeout{30000};

    /**
     * @brief 单个文件的大小上限，默认 1MB
     */
    size_t max_file_size_bytes = 1024 * 1024;

    /**
     * @brief 允许的源文件扩展名（不区分大小写）
     */
    std::vector<std::string> allowed_extensions{".cpp", ".cc", ".cxx"};

    /**
     * @brief 测试单元中允许出现的辅助头文件扩展名
     * 这些头文件对学生代码和测试代码都可见
     */
    std::vector<std::string> header_extensions{".h", ".hpp", ".hh"};

    /**
     * @brief 沙箱的根目录，每次评测在其下创建独立的沙箱目录
     *
     * sandbox_root
     * └── sandboxes
     *     └── sandbox_[student]_[assignment]_[uuid] // 每次评测独立的沙箱，权限为 0700
     *         ├── src // 学生代码
     *         ├── build // 编译器的临时文件
     *         ├── tests // 测试单元和辅助头文件，以及测试程序的执行环境
     *         │   └── context_[uuid] // 一次测试执行的执行环境，结束后删除
     *         └── output // 编译产物
     */
    std::filesystem::path sandbox_root = std::filesystem::temp_directory_path() / "grader";

    fixed_score max_score{10000};

    /**
     * @brief 执行日志的字符数上限
     */
    size_t max_log_chars = 10000;

    /**
     * @brief 学生代码中禁止出现的字符串，默认为空
     */
    std::vector<std::string> forbidden_tokens;

    /**
     * @brief 评测结束后保留沙箱目录，以便手动检查产生的文件
     */
    bool keep_sandbox = false;
};

/**
 * @brief 编译工具链和子进程资源限制的配置，对所有评测生效
 * 默认值在构建时确定（编译器、GoogleTest 和运行时支持库的位置）
 */
struct toolchain_config {
    toolchain_config();

    /**
     * @brief 编译器驱动，必须兼容 GCC 的命令行参数和诊断格式
     */
    std::string compiler;

    std::vector<std::string> compile_flags{"-std=c++17", "-O2", "-Wall", "-fdiagnostics-color=never"};

    /**
     * @brief 额外允许学生代码访问的头文件目录
     */
    std::vector<std::filesystem::path> include_dirs;

    std::vector<std::string> link_flags{"-pthread"};

    std::filesystem::path gtest_include_dir;
    std::filesystem::path gtest_library;

    /**
     * @brief 运行时支持库，提供测试程序的 main 函数和测试事件监听器
     */
    std::filesystem::path runtime_library;

    std::chrono::milliseconds compile_timeout{60000};
    int64_t compile_memory_limit = 2048LL << 20;  // 2G
    int64_t compile_file_limit = 256LL << 20;     // 256M

    int64_t test_memory_limit = 1024LL << 20;  // 1G
    double test_cpu_limit = 0;                 // 单位为秒，0 表示只限制时钟时间
    int64_t test_file_limit = 64LL << 20;      // 64M
    size_t test_nproc = 0;

    /**
     * @brief 子进程 stdout、stderr 各自最多保留的字节数
     */
    int64_t stream_size = 64 << 10;

    /**
     * @brief 单条测试事件的长度上限和一个测试程序最多上报的事件数
     */
    size_t max_event_line = 64 << 10;
    size_t max_events = 100000;

    /**
     * @brief 测试执行超时后等待任务结束的时间
     */
    std::chrono::milliseconds cancel_grace{2000};

    bool unshare_namespaces = false;
};

/**
 * @brief 检查评测配置的取值
 * @throw configuration_error 时间上限、大小上限或日志长度上限不是正数，满分为负数
 */
void validate(const evaluation_config &config);

/**
 * @throw configuration_error 取值不合法，见 validate
 */
void from_json(const nlohmann::json &j, evaluation_config &config);

void from_json(const nlohmann::json &j, toolchain_config &config);

/**
 * @brief 从 JSON 配置文件读取配置
 * 文件格式为 {"evaluation": {...}, "toolchain": {...}}，两部分都可以省略
 * @throw configuration_error 文件不存在或格式错误
 */
void load_configuration(const std::filesystem::path &path, evaluation_config &evaluation, toolchain_config &toolchain);

}  // namespace grader
