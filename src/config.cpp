#include "config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

toolchain_config::toolchain_config()
    : compiler(GRADER_DEFAULT_COMPILER),
      gtest_include_dir(GRADER_GTEST_INCLUDE_DIR),
      gtest_library(GRADER_GTEST_LIBRARY),
      runtime_library(GRADER_RUNTIME_LIBRARY) {}

template <typename T>
static void get_optional(const json &j, const char *key, T &value) {
    if (j.count(key))
        j.at(key).get_to(value);
}

/**
 * @brief 读取正整数形式的大小，负数不能直接转换为 size_t
 */
static void get_positive_size(const json &j, const char *key, size_t &value) {
    if (!j.count(key)) return;
    int64_t number = j.at(key).get<int64_t>();
    if (number <= 0)
        throw configuration_error(fmt::format("{} should be positive, got {}", key, number));
    value = (size_t)number;
}

void validate(const evaluation_config &config) {
    if (config.timeout.count() <= 0)
        throw configuration_error(fmt::format("timeout should be positive, got {}ms", config.timeout.count()));
    if (config.max_file_size_bytes == 0)
        throw configuration_error("max_file_size_bytes should be positive");
    if (config.max_log_chars == 0)
        throw configuration_error("max_log_chars should be positive");
    if (config.max_score.hundredths < 0)
        throw configuration_error("max_score should not be negative, got " + config.max_score.to_string());
    if (config.sandbox_root.empty())
        throw configuration_error("sandbox_root should not be empty");
    if (config.allowed_extensions.empty())
        throw configuration_error("allowed_extensions should not be empty");
}

void from_json(const json &j, evaluation_config &config) {
    if (j.count("timeout_ms"))
        config.timeout = chrono::milliseconds(j.at("timeout_ms").get<int64_t>());
    get_positive_size(j, "max_file_size_bytes", config.max_file_size_bytes);
    get_optional(j, "allowed_extensions", config.allowed_extensions);
    get_optional(j, "header_extensions", config.header_extensions);
    if (j.count("sandbox_root"))
        config.sandbox_root = j.at("sandbox_root").get<string>();
    if (j.count("max_score"))
        config.max_score = fixed_score::from_double(j.at("max_score").get<double>());
    get_positive_size(j, "max_log_chars", config.max_log_chars);
    get_optional(j, "forbidden_tokens", config.forbidden_tokens);
    get_optional(j, "keep_sandbox", config.keep_sandbox);
    validate(config);
}

void from_json(const json &j, toolchain_config &config) {
    get_optional(j, "compiler", config.compiler);
    get_optional(j, "compile_flags", config.compile_flags);
    if (j.count("include_dirs")) {
        config.include_dirs.clear();
        for (const string &dir : j.at("include_dirs").get<vector<string>>())
            config.include_dirs.emplace_back(dir);
    }
    get_optional(j, "link_flags", config.link_flags);
    if (j.count("gtest_include_dir"))
        config.gtest_include_dir = j.at("gtest_include_dir").get<string>();
    if (j.count("gtest_library"))
        config.gtest_library = j.at("gtest_library").get<string>();
    if (j.count("runtime_library"))
        config.runtime_library = j.at("runtime_library").get<string>();
    if (j.count("compile_timeout_ms"))
        config.compile_timeout = chrono::milliseconds(j.at("compile_timeout_ms").get<int64_t>());
    get_optional(j, "compile_memory_limit", config.compile_memory_limit);
    get_optional(j, "compile_file_limit", config.compile_file_limit);
    get_optional(j, "test_memory_limit", config.test_memory_limit);
    get_optional(j, "test_cpu_limit", config.test_cpu_limit);
    get_optional(j, "test_file_limit", config.test_file_limit);
    get_optional(j, "test_nproc", config.test_nproc);
    get_optional(j, "stream_size", config.stream_size);
    get_optional(j, "max_event_line", config.max_event_line);
    get_optional(j, "max_events", config.max_events);
    if (j.count("cancel_grace_ms"))
        config.cancel_grace = chrono::milliseconds(j.at("cancel_grace_ms").get<int64_t>());
    get_optional(j, "unshare_namespaces", config.unshare_namespaces);
}

void load_configuration(const filesystem::path &path, evaluation_config &evaluation, toolchain_config &toolchain) {
    if (!filesystem::is_regular_file(path))
        throw configuration_error("Configuration file " + path.string() + " does not exist");

    try {
        json j = json::parse(read_file_content(path));
        if (j.count("evaluation")) j.at("evaluation").get_to(evaluation);
        if (j.count("toolchain")) j.at("toolchain").get_to(toolchain);
    } catch (json::exception &ex) {
        throw configuration_error("Configuration file " + path.string() + " is malformed: " + ex.what());
    }
}

}  // namespace grader
