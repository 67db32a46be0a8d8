#include "logging.hpp"

#include <iostream>

namespace mathud::core {

void log_message(const LogCallback& callback,
                 const std::string& component,
                 const std::string& message,
                 bool is_error) {
    if (callback) {
        callback(message, is_error);
        return;
    }
    if (is_error) {
        std::cerr << "[" << component << " ERROR] " << message << std::endl;
    } else {
        std::cout << "[" << component << " INFO] " << message << std::endl;
    }
}

} // namespace mathud::core
