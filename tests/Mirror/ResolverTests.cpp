// ResolverTests.cpp — tests for accessor naming and member lookup order

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Mirror/Mirror.hpp>

namespace ResDemo
{
  struct Flags
  {
    bool ready{false};
    int items{0};
    bool isReady() const { return ready; }
    bool hasItems() const { return items > 0; }

    friend void NginReflect(NGIN::Mirror::Tag<Flags>, NGIN::Mirror::TypeBuilder<Flags> &b)
    {
      b.SetName("Res::Flags");
      b.Field<&Flags::ready>("ready");
      b.Field<&Flags::items>("items");
      b.Method<&Flags::isReady>("isReady");
      b.Method<&Flags::hasItems>("hasItems");
    }
  };

  struct Counter
  {
    int count{0};
    int total{0};
    int getCount() const { return count; }
    int total_() const { return total; }
    int getTotal() const { return -1; }
    void setCount(int v) { count = v; }

    friend void NginReflect(NGIN::Mirror::Tag<Counter>, NGIN::Mirror::TypeBuilder<Counter> &b)
    {
      b.SetName("Res::Counter");
      b.Field<&Counter::count>("count");
      b.Method<&Counter::getCount>("getCount");
      b.Method<&Counter::setCount>("setCount");
      b.Method<&Counter::total_>("total");
      b.Method<&Counter::getTotal>("getTotal");
    }
  };

  struct Widget
  {
    int width{0};
    Widget &setWidth(int w)
    {
      width = w;
      return *this;
    }
    int resize(int w, int h) { return w * h; }

    friend void NginReflect(NGIN::Mirror::Tag<Widget>, NGIN::Mirror::TypeBuilder<Widget> &b)
    {
      b.SetName("Res::Widget");
      b.Method<&Widget::setWidth>("setWidth");
      b.Method<&Widget::resize>("resize");
    }
  };

  struct Node
  {
    int code() const { return 1; }
    int label{10};

    friend void NginReflect(NGIN::Mirror::Tag<Node>, NGIN::Mirror::TypeBuilder<Node> &b)
    {
      b.SetName("Res::Node");
      b.Method<&Node::code>("code");
      b.Field<&Node::label>("label");
    }
  };

  struct Leaf : Node
  {
    int hiddenCode() const { return 2; }
    int hiddenLabel{20};

    friend void NginReflect(NGIN::Mirror::Tag<Leaf>, NGIN::Mirror::TypeBuilder<Leaf> &b)
    {
      b.SetName("Res::Leaf");
      b.Base<Node>();
      b.SetAccess(NGIN::Mirror::Access::Private);
      b.Method<&Leaf::hiddenCode>("code");
      b.Field<&Leaf::hiddenLabel>("label");
    }
  };

  struct Lamp
  {
    bool on{false};
    int count{0};
    bool readyNow() const { return true; }
    bool isReady() const { return false; }
    int countNow() const { return -1; }

    friend void NginReflect(NGIN::Mirror::Tag<Lamp>, NGIN::Mirror::TypeBuilder<Lamp> &b)
    {
      b.SetName("Res::Lamp");
      b.Field<&Lamp::count>("count");
      b.Method<&Lamp::isReady>("isReady");
      b.Method<&Lamp::readyNow>("ready");
      b.Method<&Lamp::countNow>("count");
    }
  };

  struct Celsius
  {
    double degrees{0.0};

    friend void NginReflect(NGIN::Mirror::Tag<Celsius>, NGIN::Mirror::TypeBuilder<Celsius> &b)
    {
      b.SetName("Res::Celsius");
      b.Field<&Celsius::degrees>("degrees");
    }
  };

  struct Fahrenheit
  {
    double degrees{32.0};
    Fahrenheit() = default;
    explicit Fahrenheit(const Celsius &c) : degrees(c.degrees * 9.0 / 5.0 + 32.0) {}

    friend void NginReflect(NGIN::Mirror::Tag<Fahrenheit>, NGIN::Mirror::TypeBuilder<Fahrenheit> &b)
    {
      b.SetName("Res::Fahrenheit");
      b.Constructor<Celsius>();
    }
  };
} // namespace ResDemo

TEST_CASE("FormatAccessorNameUppercasesFirstCharacter", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  CHECK(FormatAccessorName("get", "count") == "getCount");
  CHECK(FormatAccessorName("is", "x") == "isX");
  CHECK(FormatAccessorName("set", "URL") == "setURL");
  CHECK(FormatAccessorName("has", "") == "has");
}

TEST_CASE("CandidateNamesFollowConventionOrder", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto getters = CandidateNames(AccessorKind::Getter, "ready");
  REQUIRE(getters.Size() == 4);
  CHECK(getters[0] == "ready");
  CHECK(getters[1] == "getReady");
  CHECK(getters[2] == "hasReady");
  CHECK(getters[3] == "isReady");

  auto setters = CandidateNames(AccessorKind::Setter, "ready");
  REQUIRE(setters.Size() == 2);
  CHECK(setters[0] == "ready");
  CHECK(setters[1] == "setReady");
}

TEST_CASE("GetterLookupTriesPrefixes", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<ResDemo::Flags>();
  auto ready = FindGetterMethod(t, "ready");
  REQUIRE(ready.has_value());
  CHECK(ready->Name() == std::string_view{"isReady"});
  auto items = FindGetterMethod(t, "items");
  REQUIRE(items.has_value());
  CHECK(items->Name() == std::string_view{"hasItems"});
  CHECK_FALSE(FindGetterMethod(t, "nothing").has_value());
}

TEST_CASE("BareNameWinsOverPrefixedGetter", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<ResDemo::Counter>();
  auto m = FindGetterMethod(t, "total");
  REQUIRE(m.has_value());
  ResDemo::Counter c{};
  c.total = 5;
  CHECK(m->Invoke(c, nullptr, 0).value().Cast<int>() == 5);
}

TEST_CASE("SetterLookupMatchesParameterType", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<ResDemo::Counter>();
  auto setter = FindSetterMethod<int>(t, "count");
  REQUIRE(setter.has_value());
  CHECK(setter->Name() == std::string_view{"setCount"});
  CHECK_FALSE(FindSetterMethod<double>(t, "count").has_value());
}

TEST_CASE("FindMethodRequiresExactParameterList", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<ResDemo::Widget>();
  const NGIN::UInt64 two[2] = {detail::TypeIdOf<int>(), detail::TypeIdOf<int>()};
  const NGIN::UInt64 one[1] = {detail::TypeIdOf<int>()};
  CHECK(FindMethod(t, "resize", two).has_value());
  CHECK_FALSE(FindMethod(t, "resize", one).has_value());
  CHECK_FALSE(FindMethod(t, "resize", {}).has_value());
}

TEST_CASE("AccessorLookupFallsBackToSetter", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<ResDemo::Widget>();
  CHECK_FALSE(FindAccessorMethod(t, "width").has_value());
  auto m = FindAccessorMethod(t, "width", detail::TypeIdOf<int>());
  REQUIRE(m.has_value());
  CHECK(m->Name() == std::string_view{"setWidth"});
}

TEST_CASE("FluentSetterDependsOnConvention", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<ResDemo::Widget>();
  auto setter = FindSetterMethod<int>(t, "width").value();
  CHECK(IsSetterMethod(setter));
  CHECK_FALSE(IsSetterMethod(setter, AccessorConvention{false}));
  CHECK_FALSE(IsGetterMethod(setter));

  auto counter = GetType<ResDemo::Counter>();
  CHECK(IsGetterMethod(counter.GetMethod("getCount").value()));
  CHECK(IsSetterMethod(counter.GetMethod("setCount").value(), AccessorConvention{false}));
}

TEST_CASE("InheritedPublicMemberWinsOverPrivateDeclaredOne", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto leaf = GetType<ResDemo::Leaf>();
  auto node = GetType<ResDemo::Node>();

  auto m = FindGetterMethod(leaf, "code");
  REQUIRE(m.has_value());
  CHECK(m->DeclaringType() == node);

  auto f = FindField(leaf, "label");
  REQUIRE(f.has_value());
  CHECK(f->DeclaringType() == node);
}

TEST_CASE("DeclaredMembersAreFoundWhenNoPublicMatch", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto leaf = GetType<ResDemo::Leaf>();
  auto hidden = detail::VisibleFields(leaf);
  REQUIRE(hidden.Size() == 2);
  CHECK(hidden[0].DeclaringType() == GetType<ResDemo::Node>());
  CHECK(hidden[1].DeclaringType() == leaf);
  CHECK(hidden[1].GetAccess() == Access::Private);
}

TEST_CASE("FieldLookupOnUnknownNameIsEmpty", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<ResDemo::Flags>();
  CHECK(FindField(t, "ready").has_value());
  CHECK_FALSE(FindField(t, "a name nobody registered").has_value());
  CHECK_FALSE(FindField(Type{}, "ready").has_value());
}

TEST_CASE("ConstructorLookupPrefersExactParameter", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto f = GetType<ResDemo::Fahrenheit>();
  auto exact = FindConstructor<ResDemo::Celsius>(f);
  REQUIRE(exact.has_value());
  REQUIRE(exact->ParameterCount() == 1);
  CHECK(exact->ParameterTypeId(0) == detail::TypeIdOf<ResDemo::Celsius>());
}

TEST_CASE("ConstructorLookupFallsBackToZeroParameters", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  auto f = GetType<ResDemo::Fahrenheit>();
  auto fallback = FindConstructor<int>(f);
  REQUIRE(fallback.has_value());
  CHECK(fallback->ParameterCount() == 0);
}

TEST_CASE("LiteralGetterNameBeatsPrefixedOne", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  ResDemo::Lamp lamp{};
  auto wrap = MemberWrap::Find<ResDemo::Lamp>("ready");
  REQUIRE(wrap.IsMethod());
  CHECK(wrap.Name() == std::string_view{"ready"});
  CHECK(wrap.GetAs<bool>(lamp).value());
}

TEST_CASE("FieldBeatsGetterWhenNoSetterMatches", "[mirror][Resolver]")
{
  using namespace NGIN::Mirror;
  ResDemo::Lamp lamp{};
  lamp.count = 3;
  auto write = MemberWrap::Find<ResDemo::Lamp, int>("count");
  REQUIRE(write.IsField());
  CHECK(write.Set(lamp, 8));
  CHECK(lamp.count == 8);

  auto read = MemberWrap::Find<ResDemo::Lamp>("count");
  REQUIRE(read.IsMethod());
  CHECK(read.GetAs<int>(lamp).value() == -1);
}
