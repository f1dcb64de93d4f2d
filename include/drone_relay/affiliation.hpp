// === Affiliation =============================================================
//
// Trust classification applied to tracked entities and the read-through lookup
// the ingest pipeline consults. `AffiliationTable` publishes immutable
// snapshots so lookups from the control thread never block a concurrent
// reload and never see a half-written table.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace drone_relay {

/** @brief Trust classification rendered as a color in tactical events. */
enum class Affiliation {
    Authorized,    /**< Known and permitted. */
    Unauthorized,  /**< Known and not permitted. */
    Unknown,       /**< Not classified (default for civilian traffic). */
    Other          /**< Label outside the known set; rendered with the neutral fallback. */
};

/** @brief Parse a classification label (case-insensitive); unrecognized labels map to Other. */
[[nodiscard]] Affiliation parse_affiliation(std::string_view label);

/** @brief Lower-case label used in logs and serialized state. */
[[nodiscard]] std::string_view to_string(Affiliation affiliation) noexcept;

/** @brief ARGB color (signed decimal string) used by tactical clients. */
[[nodiscard]] std::string_view affiliation_color_argb(Affiliation affiliation) noexcept;

/** @brief Read-through classification lookup keyed by entity UID. */
class AffiliationResolver {
  public:
    virtual ~AffiliationResolver() = default;

    /** @brief Classification for @p uid, or nullopt when the UID is not listed. */
    [[nodiscard]] virtual std::optional<Affiliation> lookup(const std::string& uid) const = 0;
};

/** @brief Snapshot-swapping implementation of AffiliationResolver. */
class AffiliationTable final : public AffiliationResolver {
  public:
    using Snapshot = std::unordered_map<std::string, Affiliation>;

    AffiliationTable();
    explicit AffiliationTable(Snapshot initial_entries);

    [[nodiscard]] std::optional<Affiliation> lookup(const std::string& uid) const override;

    /** @brief Atomically publish a new set of entries. */
    void replace(Snapshot entries);
    /** @brief Number of entries in the current snapshot. */
    [[nodiscard]] std::size_t size() const;

  private:
    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
};

}  // namespace drone_relay
