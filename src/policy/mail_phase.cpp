#include "ivmtr_scanner/mail_phase.hpp"

namespace ivmtr {

namespace {

// "Phase 3c- ..." (no space) is a distinct spelling the feed emits alongside
// "Phase 3c - ...".
constexpr MailPhase kPhases[] = {
  {0.0f,  "Phase 0 - Origin Processing Cancellation of Postage"},
  {1.0f,  "Phase 1 - Origin Processing"},
  {1.1f,  "Phase 1a - Origin Primary Processing"},
  {1.2f,  "Phase 1b - Origin Secondary Processing"},
  {2.0f,  "Phase 2 - Destination Processing"},
  {2.1f,  "Phase 2a - Destination MMP Processing"},
  {2.2f,  "Phase 2b - Destination SCF Processing"},
  {2.3f,  "Phase 2c - Destination Primary Processing"},
  {3.0f,  "Phase 3c- Destination Sequenced Carrier Sortation"},
  {3.1f,  "Phase 3a - Destination Secondary Processing"},
  {3.2f,  "Phase 3b - Destination Box Mail Processing"},
  {3.3f,  "Phase 3c - Destination Sequenced Carrier Sortation"},
  {4.3f,  "Phase 4c - Delivery"},
  {10.0f, "PARS Processing"},
  {11.0f, "FPARS Processing"},
  {12.0f, "Miscellaneous"},
  {13.0f, "Foreign Processing"},
};

}

const MailPhase* find_mail_phase(std::string_view name) noexcept {
  for (const auto& p : kPhases) if (p.name == name) return &p;
  return nullptr;
}

const MailPhase* mail_phases(std::size_t& count) noexcept {
  count = sizeof(kPhases) / sizeof(kPhases[0]);
  return kPhases;
}

}
