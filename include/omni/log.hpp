#ifndef OMNI_LOG_HPP
#define OMNI_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace omni {
namespace log {

// Shared "omni" logger; created with a stderr sink on first use
std::shared_ptr<spdlog::logger> get();

// Reconfigure level ("trace".."off") and optionally add a file sink.
// Throws spdlog::spdlog_ex when the file cannot be opened.
void init(const std::string& level, const std::string& file = "");

} // namespace log
} // namespace omni

#endif // OMNI_LOG_HPP
