// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the relay runtime. Non-positive or unparseable values fall back to their
// defaults with a warning; the process environment is the only input.

#include "drone_relay/configuration.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "drone_relay/logging.hpp"

namespace drone_relay {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_id_prefix{"drone-"};
constexpr std::string_view k_default_cot_destination{"239.2.3.1:6969"};
constexpr int k_default_max_drones{30};
constexpr int k_default_cot_ttl{1};
constexpr int k_max_cot_ttl{255};
constexpr int k_default_queue_depth{256};
constexpr double k_default_rate_limit_s{1.0};
constexpr double k_default_inactivity_timeout_s{60.0};
constexpr double k_default_poll_interval_s{1.0};
constexpr double k_default_call_budget_s{2.0};
constexpr double k_default_shutdown_flush_s{2.0};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double '{}' from environment; using fallback {}", raw_value, fallback);
        return fallback;
    }
}

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer '{}' from environment; using fallback {}", raw_value, fallback);
        return fallback;
    }
}

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("DRONE_RELAY_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

void seed_uid_list(const char* raw_list, Affiliation affiliation, AffiliationTable::Snapshot& entries) {
    if (raw_list == nullptr) {
        return;
    }
    std::string_view remaining{raw_list};
    while (!remaining.empty()) {
        const auto comma = remaining.find(',');
        const std::string_view uid = trim(remaining.substr(0, comma));
        if (!uid.empty()) {
            entries.insert_or_assign(std::string{uid}, affiliation);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(comma + 1);
    }
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("DRONE_RELAY_LOG_LEVEL", k_default_log_level);
    if (config.log_level.empty()) {
        config.log_level = std::string{k_default_log_level};
    }

    config.registry.capacity =
        static_cast<std::size_t>(parse_int(std::getenv("DRONE_RELAY_MAX_DRONES"), k_default_max_drones));
    config.registry.inactivity_timeout = Duration{
        parse_double(std::getenv("DRONE_RELAY_INACTIVITY_TIMEOUT_S"), k_default_inactivity_timeout_s)};
    config.dispatch.rate_limit = Duration{parse_double(std::getenv("DRONE_RELAY_RATE_LIMIT_S"), k_default_rate_limit_s)};
    config.dispatch.inactivity_timeout = config.registry.inactivity_timeout;
    config.poll_interval =
        Duration{parse_double(std::getenv("DRONE_RELAY_POLL_INTERVAL_S"), k_default_poll_interval_s)};

    config.id_prefix = parse_string("DRONE_RELAY_ID_PREFIX", k_default_id_prefix);
    config.cot_destination = parse_string("DRONE_RELAY_COT_DESTINATION", k_default_cot_destination);
    config.cot_ttl = static_cast<std::uint8_t>(
        std::min(parse_int(std::getenv("DRONE_RELAY_COT_TTL"), k_default_cot_ttl), k_max_cot_ttl));
    config.state_output = parse_string("DRONE_RELAY_STATE_OUTPUT", "");

    config.delivery.max_pending =
        static_cast<std::size_t>(parse_int(std::getenv("DRONE_RELAY_DELIVERY_QUEUE_DEPTH"), k_default_queue_depth));
    config.delivery.call_budget =
        Duration{parse_double(std::getenv("DRONE_RELAY_DELIVERY_CALL_BUDGET_S"), k_default_call_budget_s)};
    config.delivery.shutdown_timeout =
        Duration{parse_double(std::getenv("DRONE_RELAY_SHUTDOWN_FLUSH_S"), k_default_shutdown_flush_s)};

    config.affiliations = load_affiliations();

    logger->info("Configuration loaded: max_drones={} rate_limit_s={} inactivity_timeout_s={} cot_destination='{}' "
                 "state_output='{}' affiliations={}",
                 config.registry.capacity,
                 config.dispatch.rate_limit.count(),
                 config.registry.inactivity_timeout.count(),
                 config.cot_destination,
                 config.state_output,
                 config.affiliations.size());

    return config;
}

AffiliationTable::Snapshot ConfigurationLoader::load_affiliations() {
    AffiliationTable::Snapshot entries{};
    seed_uid_list(std::getenv("DRONE_RELAY_AUTHORIZED_UIDS"), Affiliation::Authorized, entries);
    seed_uid_list(std::getenv("DRONE_RELAY_UNAUTHORIZED_UIDS"), Affiliation::Unauthorized, entries);
    return entries;
}

}  // namespace drone_relay
