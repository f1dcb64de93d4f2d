// === Delivery Worker =========================================================
//
// Background executor that keeps slow collaborators off the control thread.
// Tasks queue in a bounded FIFO; when the queue is full the oldest pending
// task is shed so a stalled consumer costs bounded memory instead of stalling
// ingestion. Each task runs through guard_call and is timed against a
// per-call budget. A worker still stuck in a call when stop() gives up is
// detached; its state is shared with the thread so it outlives the owner.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "drone_relay/logging.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief Queue bound and timing for one worker. */
struct DeliveryWorkerConfig final {
    std::size_t max_pending{256};            /**< Pending tasks kept before shedding the oldest. */
    Duration call_budget{Duration{2.0}};     /**< Calls running longer are reported. */
    Duration shutdown_timeout{Duration{2.0}};/**< Drain deadline used by stop(). */
};

/** @brief Single-threaded bounded task queue for one downstream consumer. */
class DeliveryWorker final {
  public:
    using Task = std::function<void()>;

    DeliveryWorker(std::string name, DeliveryWorkerConfig config);
    ~DeliveryWorker();

    DeliveryWorker(const DeliveryWorker&) = delete;
    DeliveryWorker& operator=(const DeliveryWorker&) = delete;

    /**
     * @brief Queue a task; returns false once the worker has stopped.
     *
     * A full queue drops its oldest task to make room.
     */
    [[nodiscard]] bool post(Task task);
    /** @brief Wait until queued and running tasks finish or @p timeout passes. */
    bool drain(Duration timeout);
    /**
     * @brief Drain with the configured deadline, then stop the thread.
     *
     * Returns within roughly the deadline even when a call never returns:
     * the thread is detached and finishes (or not) on its own.
     */
    void stop();

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] std::size_t completed_count() const noexcept;
    [[nodiscard]] std::size_t failure_count() const noexcept;
    [[nodiscard]] std::size_t dropped_count() const noexcept;

    /** @brief True while a task is executing on the worker thread. */
    [[nodiscard]] bool busy() const;

  private:
    /** @brief Everything the worker thread touches; shared so a detached thread stays valid. */
    struct State final {
        std::string str_name;
        DeliveryWorkerConfig config;
        std::mutex mutex;
        std::condition_variable cv_task_available;
        std::condition_variable cv_idle;
        std::deque<Task> queue_tasks;
        bool flag_busy{false};
        bool flag_stopping{false};
        std::atomic<std::size_t> completed_count{0};
        std::atomic<std::size_t> failure_count{0};
        std::atomic<std::size_t> dropped_count{0};
        std::shared_ptr<spdlog::logger> logger;
    };

    static void run_loop(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
    std::thread worker_thread_;
};

}  // namespace drone_relay
