#pragma once

#include <chrono>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <queue>

namespace hjudge {

/**
 * @brief 并发队列，写者读者模型
 * 队列可以指定容量上限，也可以被关闭：关闭后不再接受新元素，
 * 读者取完剩余元素后 pop 返回 false。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    explicit concurrent_queue(std::size_t capacity = std::numeric_limits<std::size_t>::max())
        : capacity(capacity) {}

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
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @param element 保存队头元素
     * @return 若队列已关闭且为空，返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        not_empty.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 在 timeout 时间内等待并弹出队头元素
     */
    template <typename Rep, typename Period>
    bool pop_for(T &element, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!not_empty.wait_for(mlock, timeout, [this] { return !q.empty() || closed; }))
            return false;
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素，如果队列已满则阻塞等待
     * @return 若队列已关闭，返回 false，元素不会被插入
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        not_full.wait(mlock, [this] { return q.size() < capacity || closed; });
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者和写者
     */
    void close() {
        {
            std::scoped_lock<std::mutex> mlock(mut);
            closed = true;
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

    std::size_t size() const {
        std::scoped_lock<std::mutex> mlock(mut);
        return q.size();
    }

    bool full() const {
        std::scoped_lock<std::mutex> mlock(mut);
        return q.size() >= capacity;
    }

private:
    const std::size_t capacity;
    bool closed = false;
    std::queue<T> q;
    mutable std::mutex mut;
    std::condition_variable not_empty, not_full;
};

}  // namespace hjudge
