#include "drone_relay/delivery_worker.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "drone_relay/delivery_result.hpp"

namespace drone_relay {

DeliveryWorker::DeliveryWorker(std::string name, DeliveryWorkerConfig config)
    : state_(std::make_shared<State>()) {
    if (config.max_pending == 0) {
        throw std::invalid_argument("DeliveryWorker queue depth must be positive");
    }
    state_->str_name = std::move(name);
    state_->config = config;
    state_->logger = get_logger();
    worker_thread_ = std::thread([state = state_]() { run_loop(state); });
}

DeliveryWorker::~DeliveryWorker() {
    stop();
}

bool DeliveryWorker::post(Task task) {
    State& state = *state_;
    {
        std::scoped_lock lock(state.mutex);
        if (state.flag_stopping) {
            return false;
        }
        if (state.queue_tasks.size() >= state.config.max_pending) {
            state.queue_tasks.pop_front();
            const std::size_t dropped = state.dropped_count.fetch_add(1) + 1;
            state.logger->warn("Delivery worker {} queue full; dropped oldest task ({} dropped so far)", state.str_name, dropped);
        }
        state.queue_tasks.push_back(std::move(task));
    }
    state.cv_task_available.notify_one();
    return true;
}

bool DeliveryWorker::drain(Duration timeout) {
    State& state = *state_;
    std::unique_lock lock(state.mutex);
    return state.cv_idle.wait_for(lock, timeout, [&state]() {
        return state.queue_tasks.empty() && !state.flag_busy;
    });
}

void DeliveryWorker::stop() {
    if (!worker_thread_.joinable()) {
        return;
    }
    State& state = *state_;
    const bool drained = drain(state.config.shutdown_timeout);
    bool still_busy = false;
    {
        std::scoped_lock lock(state.mutex);
        if (!drained && !state.queue_tasks.empty()) {
            state.logger->warn("Delivery worker {} abandoning {} pending tasks at shutdown", state.str_name, state.queue_tasks.size());
            state.queue_tasks.clear();
        }
        state.flag_stopping = true;
        still_busy = state.flag_busy;
    }
    state.cv_task_available.notify_all();
    if (still_busy) {
        state.logger->warn("Delivery worker {} still inside a call after {:.3f}s; detaching it",
                           state.str_name, state.config.shutdown_timeout.count());
        worker_thread_.detach();
        return;
    }
    worker_thread_.join();
}

const std::string& DeliveryWorker::name() const noexcept {
    return state_->str_name;
}

std::size_t DeliveryWorker::completed_count() const noexcept {
    return state_->completed_count.load();
}

std::size_t DeliveryWorker::failure_count() const noexcept {
    return state_->failure_count.load();
}

std::size_t DeliveryWorker::dropped_count() const noexcept {
    return state_->dropped_count.load();
}

bool DeliveryWorker::busy() const {
    std::scoped_lock lock(state_->mutex);
    return state_->flag_busy;
}

void DeliveryWorker::run_loop(const std::shared_ptr<State>& shared_state) {
    State& state = *shared_state;
    while (true) {
        Task task;
        {
            std::unique_lock lock(state.mutex);
            state.cv_task_available.wait(lock, [&state]() {
                return state.flag_stopping || !state.queue_tasks.empty();
            });
            if (state.queue_tasks.empty()) {
                // Only reachable once stopping.
                return;
            }
            task = std::move(state.queue_tasks.front());
            state.queue_tasks.pop_front();
            state.flag_busy = true;
        }

        const TimePoint started = SteadyClock::now();
        const DeliveryResult result = guard_call(task);
        const Duration elapsed = elapsed_between(started, SteadyClock::now());

        if (!result.ok) {
            state.failure_count.fetch_add(1);
            state.logger->warn("Delivery worker {} task failed: {}", state.str_name, result.error);
        }
        if (elapsed > state.config.call_budget) {
            state.logger->warn("Delivery worker {} call took {:.3f}s (budget {:.3f}s)", state.str_name, elapsed.count(), state.config.call_budget.count());
        }
        state.completed_count.fetch_add(1);

        {
            std::scoped_lock lock(state.mutex);
            state.flag_busy = false;
        }
        state.cv_idle.notify_all();
    }
}

}  // namespace drone_relay
