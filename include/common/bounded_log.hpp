#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace grader {

/**
 * @brief 有长度上限的日志缓冲区
 * 超出上限后追加一次截断标记，之后的内容全部丢弃。可以被多个线程同时写入。
 */
struct bounded_log {
    static constexpr const char *TRUNCATION_MARKER = "\n... [Log truncated due to size limit] ...";

    explicit bounded_log(size_t max_chars);

    /**
     * @brief 追加一行日志，自动补上换行符
     */
    void append_line(const std::string &line);

    std::string str() const;

    bool truncated() const;

private:
    size_t max_chars;
    bool is_truncated = false;
    std::string content;
    mutable std::mutex mut;
};

}  // namespace grader
