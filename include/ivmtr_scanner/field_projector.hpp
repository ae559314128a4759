#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "ivmtr_scanner/status.hpp"

namespace ivmtr {

class Arena;
struct ScanRecord;

// Pulls "imb" and "mailPhase" out of one flat object with simdjson On-Demand.
// Every other member is skipped.
class FieldProjector {
public:
  FieldProjector();
  ~FieldProjector();

  FieldProjector(const FieldProjector&) = delete;
  FieldProjector& operator=(const FieldProjector&) = delete;

  // `padded_capacity` is the number of readable bytes at obj.data(); it must be
  // at least obj.size() + padding().
  ScanStatus project(std::string_view obj, std::size_t padded_capacity,
                     Arena& arena, ScanRecord& out);

  // Extra readable bytes the parser requires past the end of the object.
  static std::size_t padding() noexcept;

  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
};

}
