#include "ivmtr_scanner/field_projector.hpp"
#include "ivmtr_scanner/arena.hpp"
#include "ivmtr_scanner/scan_record.hpp"

#include <simdjson.h>
#include <new>

namespace ivmtr {

namespace {

constexpr std::string_view kImb = "imb";
constexpr std::string_view kMailPhase = "mailPhase";

}

struct FieldProjector::Impl {
  simdjson::ondemand::parser parser;
};

FieldProjector::FieldProjector() : p_(new Impl) {}
FieldProjector::~FieldProjector() { delete p_; }

std::size_t FieldProjector::padding() noexcept { return simdjson::SIMDJSON_PADDING; }

ScanStatus FieldProjector::project(std::string_view obj, std::size_t padded_capacity,
                                   Arena& arena, ScanRecord& out) {
  err_.clear();
  simdjson::padded_string_view view(obj.data(), obj.size(), padded_capacity);

  // Views into the parser's string buffer; valid until the next iterate().
  std::string_view imb, phase;
  bool has_imb = false, has_phase = false;

  try {
    auto doc = p_->parser.iterate(view);
    simdjson::ondemand::object o = doc.get_object();
    for (auto field : o) {
      std::string_view key = field.unescaped_key();
      const bool is_imb = (key == kImb);
      if (!is_imb && key != kMailPhase) continue;

      simdjson::ondemand::value v = field.value();
      switch (v.type()) {
        case simdjson::ondemand::json_type::string:
          if (is_imb) { imb = v.get_string(); has_imb = true; }
          else        { phase = v.get_string(); has_phase = true; }
          break;
        case simdjson::ondemand::json_type::null:
          // Treated as absent.
          if (is_imb) has_imb = false; else has_phase = false;
          break;
        default:
          err_ = "field '" + std::string(key) + "' is not a string";
          return ScanStatus::InvalidFormat;
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    err_ = e.what();
    return e.error() == simdjson::MEMALLOC ? ScanStatus::OutOfMemory : ScanStatus::InvalidFormat;
  }

  if (!has_imb || !has_phase) {
    err_ = std::string("required field missing: ") + std::string(!has_imb ? kImb : kMailPhase);
    return ScanStatus::InvalidFormat;
  }

  try {
    out.imb = arena.copy(imb);
    out.mail_phase = arena.copy(phase);
  } catch (const std::bad_alloc&) {
    err_ = "arena allocation failed";
    return ScanStatus::OutOfMemory;
  }
  return ScanStatus::Ok;
}

}
