#include <iostream>
#include <NGIN/Benchmark.hpp>
#include <NGIN/Mirror/Mirror.hpp>

using namespace NGIN;

namespace ResolverBench
{
  struct Sensor
  {
    int id{};
    double reading{};
    bool active{};
    int samples{};

    double getReading() const { return reading; }
    bool isActive() const { return active; }
    void setSamples(int v) { samples = v; }

    friend void NginReflect(NGIN::Mirror::Tag<Sensor>, NGIN::Mirror::TypeBuilder<Sensor> &b)
    {
      b.Field<&Sensor::id>("id");
      b.Field<&Sensor::reading>("reading");
      b.Field<&Sensor::active>("active");
      b.Field<&Sensor::samples>("samples");
      b.Method<&Sensor::getReading>("getReading");
      b.Method<&Sensor::isActive>("isActive");
      b.Method<&Sensor::setSamples>("setSamples");
    }
  };
}

int main()
{
  using namespace NGIN::Mirror;
  using ResolverBench::Sensor;

  auto t = GetType<Sensor>();
  auto intType = GetType<int>();

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)MemberWrap::Find(t, "id");
                        }
                        ctx.stop(); }, "Find(type, name) 10k field hits");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)MemberWrap::Find(t, "active");
                        }
                        ctx.stop(); }, "Find(type, name) 10k isX getters");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)MemberWrap::Find(t, "samples", intType);
                        }
                        ctx.stop(); }, "Find(type, name, valueType) 10k setters");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int misses = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          misses += MemberWrap::Find(t, "does_not_exist").IsEmpty() ? 1 : 0;
                        }
                        ctx.doNotOptimize(misses);
                        ctx.stop(); }, "Find(type, name) 10k misses");

  Sensor s{};
  s.reading = 1.5;
  auto reading = MemberWrap::Find(t, "reading");
  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        double sum = 0.0;
                        for (int i = 0; i < N; ++i)
                        {
                          sum += reading.Get(s).Cast<double>();
                        }
                        ctx.doNotOptimize(sum);
                        ctx.stop(); }, "MemberWrap::Get 10k getter calls");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
