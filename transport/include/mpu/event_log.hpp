#pragma once

#include "mpu/transport_events.hpp"

#include <string>

namespace mpu {

// Double-quoted JSON string literal for `value`; quotes, backslashes and control
// characters are escaped.
std::string json_quote(const std::string &value);

// One-line `<event> => {...}` renderings used by the console tool.
std::string format_event(const StartEvent &event);
std::string format_event(const ProgressEvent &event);
std::string format_event(const PauseEvent &event);
std::string format_event(const FinishEvent &event);
std::string format_event(const ErrorEvent &event);

} // namespace mpu
