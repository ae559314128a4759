#include "ivmtr_scanner/cursor.hpp"

namespace ivmtr {

std::string Cursor::where() const {
  return "'" + tel_.file + "', line " + std::to_string(tel_.line) +
         ", column " + std::to_string(tel_.column);
}

}
