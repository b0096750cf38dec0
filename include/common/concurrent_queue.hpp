#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace arbiter {

/**
 * @brief 并发队列，写者读者模型
 * 队列关闭后 push 不再生效，pop 在取完剩余元素后返回空值，
 * 这样消费者线程可以自然退出。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 队列头元素，队列已关闭且为空时返回 std::nullopt
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
     * @return 队列已经关闭时返回 false，元素被丢弃
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
     * @brief 关闭队列，唤醒所有等待的消费者
     */
    void close() {
        {
            std::scoped_lock lock(mut);
            closed = true;
        }
        cond.notify_all();
    }

    bool is_closed() {
        std::scoped_lock lock(mut);
        return closed;
    }

    std::size_t size() {
        std::scoped_lock lock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace arbiter
