#pragma once

#include <functional>
#include <string>

namespace mathud::core {

// Logging callback type for error reporting
using LogCallback = std::function<void(const std::string& message, bool is_error)>;

// Routes a message to the callback when one is set, otherwise to stdout/stderr
// with a "[component INFO]" / "[component ERROR]" prefix.
void log_message(const LogCallback& callback,
                 const std::string& component,
                 const std::string& message,
                 bool is_error = false);

} // namespace mathud::core
