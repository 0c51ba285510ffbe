#ifndef SDC_SIM_UTILS_LOGGING_HPP
#define SDC_SIM_UTILS_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace sdc_sim::logging
{

/// Name of the library logger registered with spdlog
inline constexpr const char* kLoggerName = "sdc";

/**
 * @brief Shared library logger
 *
 * Created on first use as a colored stdout logger at info level. If a logger
 * named kLoggerName is already registered (e.g. by the host application) it
 * is reused instead.
 */
std::shared_ptr<spdlog::logger> defaultLogger();

/// Set the level of the library logger
void setLevel(spdlog::level::level_enum level);

}  // namespace sdc_sim::logging

#endif  // SDC_SIM_UTILS_LOGGING_HPP
