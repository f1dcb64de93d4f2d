#include "drone_relay/affiliation.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace drone_relay {

namespace {
constexpr std::string_view k_argb_blue{"-16776961"};
constexpr std::string_view k_argb_red{"-65536"};
constexpr std::string_view k_argb_yellow{"-256"};
constexpr std::string_view k_argb_gray{"-8355712"};

std::string to_lower_copy(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}
}  // namespace

Affiliation parse_affiliation(std::string_view label) {
    const std::string lowered = to_lower_copy(label);
    if (lowered == "authorized") {
        return Affiliation::Authorized;
    }
    if (lowered == "unauthorized") {
        return Affiliation::Unauthorized;
    }
    if (lowered == "unknown") {
        return Affiliation::Unknown;
    }
    return Affiliation::Other;
}

std::string_view to_string(Affiliation affiliation) noexcept {
    switch (affiliation) {
        case Affiliation::Authorized:
            return "authorized";
        case Affiliation::Unauthorized:
            return "unauthorized";
        case Affiliation::Unknown:
            return "unknown";
        case Affiliation::Other:
            break;
    }
    return "other";
}

std::string_view affiliation_color_argb(Affiliation affiliation) noexcept {
    switch (affiliation) {
        case Affiliation::Authorized:
            return k_argb_blue;
        case Affiliation::Unauthorized:
            return k_argb_red;
        case Affiliation::Unknown:
            return k_argb_yellow;
        case Affiliation::Other:
            break;
    }
    return k_argb_gray;
}

AffiliationTable::AffiliationTable()
    : snapshot_(std::make_shared<const Snapshot>()) {}

AffiliationTable::AffiliationTable(Snapshot initial_entries)
    : snapshot_(std::make_shared<const Snapshot>(std::move(initial_entries))) {}

std::optional<Affiliation> AffiliationTable::lookup(const std::string& uid) const {
    const std::shared_ptr<const Snapshot> current = snapshot_.load();
    const auto iterator_entry = current->find(uid);
    if (iterator_entry == current->end()) {
        return std::nullopt;
    }
    return iterator_entry->second;
}

void AffiliationTable::replace(Snapshot entries) {
    snapshot_.store(std::make_shared<const Snapshot>(std::move(entries)));
}

std::size_t AffiliationTable::size() const {
    return snapshot_.load()->size();
}

}  // namespace drone_relay
