#pragma once

#include <string>
#include <string_view>

namespace verirag::log {

enum class Level { Debug, Info, Warn, Error };

// Accepts debug|info|warn|error (any case); throws std::invalid_argument otherwise.
Level parse_level(std::string_view name);

// Messages below this level are dropped. Defaults to Info.
void set_min_level(Level level);
bool enabled(Level level);

void write(Level level, std::string_view message);
void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace verirag::log
