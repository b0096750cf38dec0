#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = arbiter::scoped_guard() + [&]

namespace arbiter {

/**
 * @brief 在作用域结束时执行回调
 * 无论作用域是正常返回还是因为异常退出，回调都会被执行恰好一次。
 * 回调抛出的异常会被记录到日志后忽略，避免在栈展开时调用 std::terminate。
 */
struct scoped_guard {
    scoped_guard();
    scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

    /**
     * @brief 取消回调，之后析构时不再执行
     */
    void dismiss();

private:
    std::function<void()> f;
};

}  // namespace arbiter
