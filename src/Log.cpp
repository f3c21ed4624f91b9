#include <NGIN/Mirror/Log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>

namespace NGIN::Mirror
{
  namespace
  {
    std::shared_ptr<spdlog::logger> CreateLogger()
    {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      sink->set_pattern("%^[%T] [%n] [%l]%$ %v");
      auto logger = std::make_shared<spdlog::logger>("NGIN.Mirror", std::move(sink));
      logger->set_level(spdlog::level::warn);
      return logger;
    }
  } // namespace

  std::shared_ptr<spdlog::logger> &Log::GetLogger()
  {
    static std::shared_ptr<spdlog::logger> s_logger = CreateLogger();
    return s_logger;
  }

  void Log::SetLogger(std::shared_ptr<spdlog::logger> logger)
  {
    if (!logger)
      return;
    GetLogger() = std::move(logger);
  }

  void Log::SetLevel(spdlog::level::level_enum level)
  {
    GetLogger()->set_level(level);
  }
} // namespace NGIN::Mirror
