// BaseMetadata.cpp — tests for base-class metadata

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Mirror/Mirror.hpp>

namespace BaseDemo
{
  struct Vehicle
  {
    int wheels{4};

    friend void NginReflect(NGIN::Mirror::Tag<Vehicle>, NGIN::Mirror::TypeBuilder<Vehicle> &b)
    {
      b.SetName("BaseDemo::Vehicle");
      b.Field<&Vehicle::wheels>("wheels");
    }
  };

  struct Engine
  {
    int power{0};

    friend void NginReflect(NGIN::Mirror::Tag<Engine>, NGIN::Mirror::TypeBuilder<Engine> &b)
    {
      b.SetName("BaseDemo::Engine");
    }
  };

  struct Truck : Vehicle, Engine
  {
    int load{0};

    static Truck *FromVehicle(Vehicle *v) { return static_cast<Truck *>(v); }

    friend void NginReflect(NGIN::Mirror::Tag<Truck>, NGIN::Mirror::TypeBuilder<Truck> &b)
    {
      b.SetName("BaseDemo::Truck");
      b.Base<Vehicle, &Truck::FromVehicle>();
      b.Base<Engine>();
      b.Field<&Truck::load>("load");
    }
  };
} // namespace BaseDemo

TEST_CASE("BaseMetadataProvidesUpcastAndDowncast", "[mirror][Base]")
{
  using namespace NGIN::Mirror;
  using BaseDemo::Truck;
  using BaseDemo::Vehicle;

  auto t = GetType<Truck>();
  REQUIRE(t.BaseCount() == 2);
  auto vehicle = t.GetBase(GetType<Vehicle>());
  REQUIRE(vehicle.has_value());
  CHECK(vehicle->BaseType() == GetType<Vehicle>());

  Truck truck{};
  truck.wheels = 6;
  truck.load = 12;
  auto *vp = static_cast<Vehicle *>(vehicle->Upcast(&truck));
  REQUIRE(vp != nullptr);
  CHECK(vp->wheels == 6);
  REQUIRE(vehicle->CanDowncast());
  auto *tp = static_cast<Truck *>(vehicle->Downcast(vp));
  REQUIRE(tp == &truck);
  CHECK(tp->load == 12);
}

TEST_CASE("BaseWithoutDowncastOnlyUpcasts", "[mirror][Base]")
{
  using namespace NGIN::Mirror;
  using BaseDemo::Engine;
  using BaseDemo::Truck;

  auto engine = GetType<Truck>().FindBase(GetType<Engine>());
  REQUIRE(engine.has_value());
  CHECK_FALSE(engine->CanDowncast());

  Truck truck{};
  truck.power = 300;
  auto *ep = static_cast<Engine *>(engine->Upcast(&truck));
  REQUIRE(ep != nullptr);
  CHECK(ep->power == 300);
  CHECK(engine->Downcast(ep) == nullptr);
}

TEST_CASE("UnrelatedBaseIsNotFound", "[mirror][Base]")
{
  using namespace NGIN::Mirror;
  auto truck = GetType<BaseDemo::Truck>();
  auto engine = GetType<BaseDemo::Engine>();
  CHECK_FALSE(engine.FindBase(truck).has_value());
  auto missing = engine.GetBase(truck);
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);
  CHECK_FALSE(Type{}.FindBase(engine).has_value());
}
