#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::arena::scoped_guard() + [&]

namespace arena {

/**
 * @brief 在离开作用域时执行清理函数
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard &operator=(scoped_guard &&) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace arena
