#include "sdc-sim/src/Utils/Logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sdc_sim::logging
{

std::shared_ptr<spdlog::logger> defaultLogger()
{
  static std::mutex creationMutex;
  std::lock_guard<std::mutex> const lock{creationMutex};

  if (auto existing = spdlog::get(kLoggerName))
  {
    return existing;
  }

  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_level(spdlog::level::info);
  return logger;
}

void setLevel(spdlog::level::level_enum level)
{
  defaultLogger()->set_level(level);
}

}  // namespace sdc_sim::logging
