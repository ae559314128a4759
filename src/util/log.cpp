#include "ivmtr_scanner/log.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace ivmtr::log {

namespace {

std::atomic<Level> g_level{Level::Warn};
std::mutex g_out_mu;

const char* level_name(Level lv) {
  switch (lv) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "?";
}

}

void  set_level(Level lv) noexcept { g_level.store(lv, std::memory_order_relaxed); }
Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

Level parse_level(std::string_view s) noexcept {
  std::string low;
  for (char c : s) low.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (low == "debug") return Level::Debug;
  if (low == "info")  return Level::Info;
  if (low == "warn" || low == "warning") return Level::Warn;
  if (low == "error") return Level::Error;
  if (low == "off" || low == "none") return Level::Off;
  return Level::Warn;
}

void init_from_env() {
  const char* v = std::getenv("IVMTR_LOG_LEVEL");
  if (v && *v) set_level(parse_level(v));
}

void write(Level lv, std::string_view tag, std::string_view msg) {
  if (!enabled(lv)) return;
  std::lock_guard<std::mutex> lk(g_out_mu);
  std::cerr << "[" << tag << "] " << level_name(lv) << ": " << msg << "\n";
}

}
