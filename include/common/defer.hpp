#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 离开作用域时执行清理函数
 * 通过 defer 宏使用，比如关闭文件描述符、杀死子进程组
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消清理，离开作用域时不再执行
     */
    void dismiss();
};

}  // namespace grader
