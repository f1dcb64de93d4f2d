// === Delivery Results ========================================================
//
// Explicit per-operation outcome for calls that cross into collaborators
// (encoder, outbound transport, sinks). `guard_call` is the single place where
// a collaborator's exception becomes a value; callers inspect the result and
// always move on to the next operation.

#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace drone_relay {

/** @brief Outcome of one collaborator call. */
struct DeliveryResult final {
    bool ok{true};
    std::string error{};

    [[nodiscard]] static DeliveryResult success() {
        return DeliveryResult{};
    }

    [[nodiscard]] static DeliveryResult failure(std::string message) {
        return DeliveryResult{false, std::move(message)};
    }
};

/** @brief Counts for one fan-out across the registered sinks. */
struct FanoutReport final {
    std::size_t calls{};
    std::size_t failures{};

    FanoutReport& operator+=(const FanoutReport& other) noexcept {
        calls += other.calls;
        failures += other.failures;
        return *this;
    }
};

/** @brief Run @p operation and report any exception it raises, of any type, as a failure. */
template <typename Operation>
[[nodiscard]] DeliveryResult guard_call(Operation&& operation) {
    try {
        std::forward<Operation>(operation)();
        return DeliveryResult::success();
    } catch (const std::exception& exc) {
        return DeliveryResult::failure(exc.what());
    } catch (...) {
        return DeliveryResult::failure("non-standard exception");
    }
}

}  // namespace drone_relay
