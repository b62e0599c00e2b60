#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace grader {

struct evaluation_config;

/**
 * @brief 文件在沙箱中的用途，决定允许的扩展名
 */
enum class file_kind {
    /**
     * @brief 需要编译的源文件
     */
    SOURCE,

    /**
     * @brief 测试单元，可以是源文件，也可以是辅助头文件
     */
    TEST_UNIT
};

/**
 * @brief 输入校验器
 * 在任何文件被写入磁盘之前校验文件名、路径、大小、内容和标识符。
 * 所有函数都没有副作用，校验失败时抛出 validation_error。
 */
struct input_sanitizer {
    static constexpr size_t MAX_NAME_LENGTH = 255;
    static constexpr size_t MAX_IDENTIFIER_LENGTH = 50;

    explicit input_sanitizer(const evaluation_config &config);

    /**
     * @brief 校验文件名和大小，并计算文件在沙箱中的位置
     * 文件名先做一次百分号解码，再做路径规范化，之后的检查都基于规范化的结果：
     * 1. 不能为空，不能超过 255 字节
     * 2. 不能是绝对路径，不能包含 ".." 或以 "~" 开头的路径段
     * 3. 不能包含控制字符、NUL 以及 \ < > : " | ? *
     * 4. 扩展名必须在允许列表中（不区分大小写）
     * 5. 大小必须大于 0 且不超过上限
     * 6. 最终路径必须位于 destination_dir 之内（符号链接会被解析）
     * @param name 学生或出题人声明的文件名
     * @param size 文件大小，单位为字节
     * @param destination_dir 文件将要被写入的沙箱目录，可以尚未创建
     * @param kind 文件用途
     * @return 规范化后的绝对路径
     */
    std::filesystem::path sanitize(const std::string &name, size_t size, const std::filesystem::path &destination_dir, file_kind kind = file_kind::SOURCE) const;

    /**
     * @brief 校验学生编号、作业编号这类会出现在沙箱目录名中的标识符
     * 只允许字母、数字、下划线和连字符，长度为 1 到 50，不能以下划线或连字符开头或结尾
     * @param field 字段名，用于错误信息
     */
    void validate_identifier(const std::string &id, const std::string &field) const;

    /**
     * @brief 校验文件内容
     * 内容不能为空或只有空白字符，不能包含配置中禁止的字符串
     */
    void screen_content(const std::string &content, const std::string &field) const;

    /**
     * @brief 判断文件名是否为辅助头文件
     */
    bool is_header(const std::filesystem::path &name) const;

private:
    size_t max_file_size;
    std::vector<std::string> allowed_extensions;
    std::vector<std::string> header_extensions;
    std::vector<std::string> forbidden_tokens;
};

/**
 * @brief 对文件名做一次百分号解码，不合法的编码保持原样
 */
std::string percent_decode(const std::string &text);

}  // namespace grader
