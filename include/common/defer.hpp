#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     defer { runtime.remove_container(id); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = ::hjudge::scoped_guard() + [&]

namespace hjudge {

struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace hjudge
