#pragma once

#include <functional>

#define OJCORE_DEFER_1(x, y) x##y
#define OJCORE_DEFER_2(x, y) OJCORE_DEFER_1(x, y)
#define OJCORE_DEFER_0(x) OJCORE_DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行一段代码
 * @code{.cpp}
 *     std::string id = runtime.create_container(options);
 *     defer { runtime.remove_container(id); };
 * @endcode
 * 无论作用域是正常结束还是因为异常退出，代码段都会被执行。
 */
#define defer auto OJCORE_DEFER_0(_defered_option) = ojcore::scoped_guard() + [&]

namespace ojcore {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace ojcore
