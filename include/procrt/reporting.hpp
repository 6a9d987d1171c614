#pragma once
#include "events.hpp"
#include <string>
#include <string_view>

namespace procrt {
namespace reporting {

void set_csv(bool value);
bool csv_enabled();
void set_verbose(bool value);
bool verbose_enabled();

// "[tag] msg" lines; warn goes to stderr, debug only prints in verbose mode.
void info(std::string_view tag, const std::string& msg);
void warn(std::string_view tag, const std::string& msg);
void debug(std::string_view tag, const std::string& msg);

void report_event(const LifecycleEvent& evt);
// Raw stdout line, serialized with the log output.
void emit(const std::string& line);

} // namespace reporting
} // namespace procrt
