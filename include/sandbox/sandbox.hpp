#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 单次评测独占的沙箱目录
 * 构造时创建目录结构（权限 0700），析构时删除整个目录。
 * 沙箱之间互不共享，评测结束后不会残留任何文件。
 *
 * sandbox_[student]_[assignment]_[uuid]
 * ├── src // 学生代码
 * ├── build // 编译器的临时文件
 * ├── tests // 测试单元和辅助头文件
 * └── output // 编译产物
 */
struct sandbox {
    /**
     * @brief 计算新沙箱的路径，不访问文件系统
     * 目录名带有随机 uuid，同一学生同一作业的并发评测也不会冲突
     * @param sandbox_root 沙箱根目录
     * @param student_id 已经校验过的学生编号
     * @param assignment_id 已经校验过的作业编号
     */
    static std::filesystem::path plan(const std::filesystem::path &sandbox_root, const std::string &student_id, const std::string &assignment_id);

    /**
     * @brief 创建沙箱目录
     * @param directory 由 plan 计算出的路径，必须尚不存在
     * @param keep 为真时析构不删除目录，用于调试
     */
    sandbox(std::filesystem::path directory, bool keep = false);

    sandbox(const sandbox &) = delete;
    sandbox &operator=(const sandbox &) = delete;

    ~sandbox();

    const std::filesystem::path &root() const;
    std::filesystem::path source_dir() const;
    std::filesystem::path build_dir() const;
    std::filesystem::path tests_dir() const;
    std::filesystem::path output_dir() const;

    /**
     * @brief 写入文件，权限为 0600
     * @param destination 经过 input_sanitizer 校验的路径，必须位于沙箱内
     * @throw runner_error 路径不在沙箱内
     */
    void write_file(const std::filesystem::path &destination, const std::string &content) const;

private:
    std::filesystem::path directory;
    bool keep;
};

}  // namespace grader
