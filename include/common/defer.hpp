#pragma once

#include <functional>

#define GRADER_DEFER_1(x, y) x##y
#define GRADER_DEFER_2(x, y) GRADER_DEFER_1(x, y)
#define GRADER_DEFER_0(x) GRADER_DEFER_2(x, __COUNTER__)
#define defer auto GRADER_DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 在离开作用域时执行给定的函数，包括因为异常离开作用域的情况
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace grader
