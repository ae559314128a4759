#pragma once
#include <cstddef>
#include <string_view>

namespace ivmtr {

// Known USPS mail processing phases, ordered by how far along the mail piece
// is. Phases outside the numbered pipeline sort after Phase 4c.
struct MailPhase {
  float value;
  std::string_view name;
};

inline bool operator<(const MailPhase& a, const MailPhase& b) noexcept { return a.value < b.value; }
inline bool operator==(const MailPhase& a, const MailPhase& b) noexcept {
  return a.value == b.value && a.name == b.name;
}
inline bool operator!=(const MailPhase& a, const MailPhase& b) noexcept { return !(a == b); }

// nullptr for unrecognized names.
const MailPhase* find_mail_phase(std::string_view name) noexcept;

// Whole catalog, sorted by value.
const MailPhase* mail_phases(std::size_t& count) noexcept;

}
