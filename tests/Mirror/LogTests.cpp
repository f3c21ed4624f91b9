// LogTests.cpp — tests for the library logger

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Mirror/Mirror.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>

namespace LogDemo
{
  class Badge
  {
  public:
    Badge() = default;

  private:
    int pin{1111};

    friend void NginReflect(NGIN::Mirror::Tag<Badge>, NGIN::Mirror::TypeBuilder<Badge> &b)
    {
      b.SetName("LogDemo::Badge");
      b.SetAccess(NGIN::Mirror::Access::Private);
      b.Field<&Badge::pin>("pin");
    }
  };

  // Routes the library logger into a string for the lifetime of the scope.
  struct CapturedLog
  {
    std::ostringstream out;
    std::shared_ptr<spdlog::logger> previous = NGIN::Mirror::Log::GetLogger();

    CapturedLog()
    {
      auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(out);
      sink->set_pattern("%l %v");
      NGIN::Mirror::Log::SetLogger(std::make_shared<spdlog::logger>("NGIN.Mirror.Test", std::move(sink)));
    }
    ~CapturedLog() { NGIN::Mirror::Log::SetLogger(previous); }
  };
} // namespace LogDemo

TEST_CASE("SwallowedGetFailureLogsAtDebug", "[mirror][Log]")
{
  using namespace NGIN::Mirror;
  LogDemo::CapturedLog capture;
  Log::SetLevel(spdlog::level::debug);

  LogDemo::Badge badge{};
  auto pin = MemberWrap::Find<LogDemo::Badge>("pin");
  REQUIRE(pin.IsField());
  CHECK_FALSE(pin.Get(badge).HasValue());

  const auto text = capture.out.str();
  CHECK(text.find("debug Get on private pin failed") != std::string::npos);
  CHECK(text.find("is not accessible") != std::string::npos);
}

TEST_CASE("LevelFiltersDebugMessages", "[mirror][Log]")
{
  using namespace NGIN::Mirror;
  LogDemo::CapturedLog capture;
  Log::SetLevel(spdlog::level::warn);

  LogDemo::Badge badge{};
  CHECK_FALSE(MemberWrap::Find<LogDemo::Badge>("pin").Set(badge, 5));
  CHECK(capture.out.str().empty());
}

TEST_CASE("NullLoggerIsIgnored", "[mirror][Log]")
{
  using namespace NGIN::Mirror;
  auto current = Log::GetLogger();
  Log::SetLogger(nullptr);
  CHECK(Log::GetLogger() == current);
}
