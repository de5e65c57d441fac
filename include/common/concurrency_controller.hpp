#pragma once

#include <condition_variable>
#include <mutex>

namespace hjudge {

/**
 * @brief 限制同时评测的任务数
 * worker 在从缓冲区取任务之前获取一个槽位，任务被确认之后释放。
 */
struct concurrency_controller {
    /**
     * @brief 一个槽位，析构时自动释放
     */
    struct slot {
        slot() = default;
        explicit slot(concurrency_controller *controller);
        slot(const slot &) = delete;
        slot(slot &&other) noexcept;
        slot &operator=(const slot &) = delete;
        slot &operator=(slot &&other) noexcept;
        ~slot();

        /**
         * @brief 提前释放槽位，多次调用只有第一次生效
         */
        void release();

        explicit operator bool() const;

    private:
        concurrency_controller *controller = nullptr;
    };

    /**
     * @param capacity 槽位数，至少为 1
     * @throw std::invalid_argument 如果 capacity < 1
     */
    explicit concurrency_controller(int capacity);

    /**
     * @brief 获取一个槽位，没有空闲槽位时阻塞
     */
    slot acquire();

    /**
     * @brief 尝试获取一个槽位
     * @return 没有空闲槽位时返回空的 slot
     */
    slot try_acquire();

    int running() const;

    /**
     * @brief 同时占用的槽位数的最大值
     */
    int peak() const;

    int capacity() const;

private:
    void release();

    const int total;
    int used = 0, max_used = 0;
    mutable std::mutex mut;
    std::condition_variable cv;
};

}  // namespace hjudge
