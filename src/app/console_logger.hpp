#pragma once

/// @file console_logger.hpp
/// @brief Minimal stdout sink registered as the kcenon default logger.

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace ftr::app {

class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    kcenon::common::VoidResult log(log_level level, const std::string& message) override;

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override;
    kcenon::common::VoidResult set_level(log_level level) override;
    log_level get_level() const override;
    kcenon::common::VoidResult flush() override;

private:
    std::mutex mutex_;
    std::atomic<log_level> minLevel_{log_level::trace};
};

} // namespace ftr::app
