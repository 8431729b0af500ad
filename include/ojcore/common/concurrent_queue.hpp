#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace ojcore {

/**
 * @brief 并发队列，写者读者模型
 * 队列元素可以是只能移动的类型（比如 unique_ptr）。
 * 调用 close 之后不能再插入元素，等待中的读者在队列取空后会被唤醒并得到空值。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 队列头元素，队列已关闭且为空时返回空
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 队列已经关闭时返回 false，元素不会被插入
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    mutable std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace ojcore
