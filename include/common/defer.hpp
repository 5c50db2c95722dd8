#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_deferred_action) = ::streamjudge::scoped_guard() + [&]

namespace streamjudge {

/**
 * @brief 离开作用域时执行回调
 * 通过 defer { ... }; 使用
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace streamjudge
