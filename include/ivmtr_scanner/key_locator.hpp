#pragma once
#include <string>

#include "ivmtr_scanner/status.hpp"

namespace ivmtr {

class Cursor;

// Advances past the top-level "events" key and the '[' that opens its array.
// Ok: the cursor sits just after '['. EndOfFile: the stream ended first (an
// empty or keyless feed). InvalidFormat / ReadError: err describes why.
ScanStatus locate_events_array(Cursor& cur, std::string& err);

}
