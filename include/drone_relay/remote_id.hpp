// === Remote ID Vocabulary ====================================================
//
// Fixed lookup tables shared by the normalizer and the tactical encoder: the
// Remote ID UA type codes, the id-type labels that decide how `Basic ID.id` is
// interpreted, and the tactical entity type chosen for each UA category.

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace drone_relay {

inline constexpr std::string_view k_id_type_serial_number{"Serial Number (ANSI/CTA-2063-A)"};
inline constexpr std::string_view k_id_type_caa_registration{"CAA Assigned Registration ID"};
inline constexpr std::string_view k_unknown_ua_type_name{"Unknown"};

/**
 * @brief UA classification after coercion: a code from the fixed table, or the
 *        "unknown" sentinel (empty code, name `Unknown`).
 */
struct UaClassification final {
    std::optional<int> code{};
    std::string name{k_unknown_ua_type_name};
};

/** @brief Human-readable name for @p code, or nullopt outside the table. */
[[nodiscard]] std::optional<std::string_view> ua_type_name(int code);

/** @brief Case-insensitive reverse lookup of a table name. */
[[nodiscard]] std::optional<int> ua_type_code_from_name(std::string_view name);

/** @brief Tactical entity type for an airborne track of the given UA code. */
[[nodiscard]] std::string_view cot_type_for_ua(std::optional<int> code);

}  // namespace drone_relay
