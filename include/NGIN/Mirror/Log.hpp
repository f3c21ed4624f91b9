// Log.hpp
// Library logger (spdlog). Created on first use; hosts may replace it or change its level.
#pragma once

#include <spdlog/spdlog.h>

#include <memory>

#include <NGIN/Mirror/Export.hpp>

namespace NGIN::Mirror
{
  class NGIN_MIRROR_API Log
  {
  public:
    // Defaults to a stderr sink named "NGIN.Mirror" at warn level.
    static std::shared_ptr<spdlog::logger> &GetLogger();

    static void SetLogger(std::shared_ptr<spdlog::logger> logger);
    static void SetLevel(spdlog::level::level_enum level);
  };
} // namespace NGIN::Mirror

#define NGIN_MIRROR_TRACE(...) ::NGIN::Mirror::Log::GetLogger()->trace(__VA_ARGS__)
#define NGIN_MIRROR_DEBUG(...) ::NGIN::Mirror::Log::GetLogger()->debug(__VA_ARGS__)
