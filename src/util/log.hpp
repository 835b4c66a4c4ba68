#pragma once

#include <string_view>

namespace courserag::log {

enum class Level { Debug, Info, Warn, Error };

// Records below the threshold are dropped. Defaults to Info.
void set_threshold(Level level);
Level threshold();
Level parse_level(std::string_view name);

void write(Level level, std::string_view message);
void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace courserag::log
