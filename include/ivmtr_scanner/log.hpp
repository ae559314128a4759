#pragma once
#include <string_view>

namespace ivmtr::log {

enum class Level { Debug, Info, Warn, Error, Off };

void  set_level(Level lv) noexcept;
Level level() noexcept;

// Parses "debug" | "info" | "warn" | "error" | "off"; unknown -> Warn.
Level parse_level(std::string_view s) noexcept;

// Reads IVMTR_LOG_LEVEL if set.
void init_from_env();

// Writes "[tag] message" to stderr when lv passes the threshold.
void write(Level lv, std::string_view tag, std::string_view msg);

inline bool enabled(Level lv) noexcept { return lv >= level() && lv != Level::Off; }

}
