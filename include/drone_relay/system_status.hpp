// === System Status ===========================================================
//
// Health report of the sensor host itself: its GPS fix, CPU, memory, disk and
// temperature readings, plus the SDR front-end temperatures. The status
// producer shares the input stream with Remote ID telemetry; a status message
// is an object carrying `serial_number`, `gps_data` or `system_stats`, which
// no telemetry shape does.

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "drone_relay/logging.hpp"

namespace drone_relay {

inline constexpr char k_unknown_serial_number[] = "unknown";
inline constexpr char k_unavailable_reading[] = "N/A";

/** @brief One decoded status report of the sensor host. */
struct SystemStatus final {
    std::string serial_number{k_unknown_serial_number};
    double lat{};                    /**< Host latitude in degrees. */
    double lon{};                    /**< Host longitude in degrees. */
    double alt{};                    /**< Host altitude in metres. */
    double speed{};                  /**< Host ground speed in m/s. */
    double track{};                  /**< Host course in degrees. */
    double cpu_usage{};              /**< Percent. */
    double memory_total_mb{};
    double memory_available_mb{};
    double disk_total_mb{};
    double disk_used_mb{};
    double temperature{};            /**< Host CPU temperature in °C. */
    double uptime{};                 /**< Seconds. */
    std::string pluto_temp{k_unavailable_reading};
    std::string zynq_temp{k_unavailable_reading};

    /** @brief False for the (0,0) position reported before the GPS has a fix. */
    [[nodiscard]] bool has_position() const noexcept;
};

/** @brief True when @p message has the shape of a status report rather than telemetry. */
[[nodiscard]] bool is_system_status_message(const nlohmann::json& message) noexcept;

/** @brief Decodes status reports leniently; missing readings keep their defaults. */
class SystemStatusParser final {
  public:
    explicit SystemStatusParser(std::shared_ptr<spdlog::logger> logger);

    /** @return The status, or nullopt when @p message is not a status report. */
    [[nodiscard]] std::optional<SystemStatus> parse(const nlohmann::json& message) const;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
