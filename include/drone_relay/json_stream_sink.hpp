// === JSON Stream Sink ========================================================
//
// Sink that keeps a merged per-drone state document and writes it as one JSON
// line on every publish. Pilot and home patches merge into the same document
// so consumers always see the latest full picture for a drone. Sensor host
// status reports are written as their own `"type":"system"` lines.

#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "drone_relay/logging.hpp"
#include "drone_relay/sink.hpp"

namespace drone_relay {

/** @brief Convert a carrier frequency to MHz (values above 1e5 are taken as Hz), rounded to 3 places. */
[[nodiscard]] std::optional<double> frequency_mhz(std::optional<double> frequency);

/** @brief Compact state document for @p record. */
[[nodiscard]] nlohmann::json drone_state_document(const DroneRecord& record);

/** @brief Document written for a sensor host status report. */
[[nodiscard]] nlohmann::json system_status_document(const SystemStatus& status);

class JsonStreamSink final : public Sink {
  public:
    /** @brief Append to the file at @p output_path; throws std::runtime_error when it cannot be opened. */
    explicit JsonStreamSink(const std::filesystem::path& output_path);
    /** @brief Write to a caller-owned stream that must outlive the sink. */
    explicit JsonStreamSink(std::ostream& output);

    [[nodiscard]] SinkCapabilities capabilities() const override;

    void publish_drone(const DroneRecord& record) override;
    void publish_pilot(const std::string& drone_id, double lat, double lon, double alt) override;
    void publish_home(const std::string& drone_id, double lat, double lon, double alt) override;
    void mark_inactive(const std::string& drone_id) override;
    void close() override;
    void publish_system(const SystemStatus& status) override;

    /** @brief Number of drones with cached state. */
    [[nodiscard]] std::size_t cached_count() const;

  private:
    void merge_and_write(const std::string& drone_id, const nlohmann::json& patch);
    void write_line(const nlohmann::json& document);

    std::unique_ptr<std::ofstream> owned_stream_;
    std::ostream* output_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> map_state_cache_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
