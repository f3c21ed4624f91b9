#include <NGIN/Mirror/Mirror.hpp>

#include <iostream>
#include <string>

namespace Demo {
  struct Celsius {
    double degrees{0.0};
  };

  struct Thermostat {
    double target{20.0};
    bool heating{false};

    bool isHeating() const { return heating; }
    void setTarget(double t) { target = t; heating = t > 21.0; }

    Thermostat() = default;
    explicit Thermostat(const Celsius &c) : target(c.degrees) {}

    friend void NginReflect(NGIN::Mirror::Tag<Thermostat>, NGIN::Mirror::TypeBuilder<Thermostat> &b) {
      b.SetName("Demo::Thermostat");
      b.Field<&Thermostat::target>("target");
      b.Field<&Thermostat::heating>("heating");
      b.Method<&Thermostat::isHeating>("isHeating");
      b.Method<&Thermostat::setTarget>("setTarget");
      b.Constructor<Celsius>();
    }
  };
}

int main() {
  using namespace NGIN::Mirror;
  std::cout << "Library: " << LibraryName() << "\n";

  Demo::Thermostat th{};

  // "heating" resolves to the isHeating() getter before the field.
  auto heating = MemberWrap::Find<Demo::Thermostat>("heating");
  std::cout << "read heating via " << heating.Signature() << "\n";

  // With a value type, "target" resolves to the setTarget(double) setter.
  auto target = MemberWrap::Find<Demo::Thermostat, double>("target");
  std::cout << "write target via " << target.Signature() << "\n";
  target.Set(th, 23.5);
  std::cout << "heating = " << std::boolalpha << heating.GetAs<bool>(th).value_or(false) << "\n";

  // A constructor can stand in as a getter that converts the receiver.
  auto fromCelsius = MemberWrap::ForConstructor<Demo::Celsius, Demo::Thermostat>();
  Demo::Celsius c{18.0};
  if (auto made = fromCelsius.GetChecked(c))
    std::cout << "constructed target = " << made->Cast<Demo::Thermostat>().target << "\n";
  else
    std::cout << "construct failed: " << made.error().message << "\n";

  auto members = MemberWrap::Members(GetType<Demo::Thermostat>());
  for (NGIN::UIntSize i = 0; i < members.Size(); ++i)
    std::cout << "  " << members[i].ToString() << "\n";

  return 0;
}
