// MemberWrapDispatch.cpp — tests for visiting, describing and comparing wraps

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Mirror/Mirror.hpp>

#include <string>
#include <unordered_set>

namespace WrapDispatchDemo
{
  struct Mock
  {
    int field{0};
    inline static const int limit = 5;
    void method() {}
    int sum(int a, float b) const { return a + static_cast<int>(b); }
    static int twice(int v) { return v * 2; }

    friend void NginReflect(NGIN::Mirror::Tag<Mock>, NGIN::Mirror::TypeBuilder<Mock> &b)
    {
      b.SetName("WrapDispatch::Mock");
      b.Field<&Mock::field>("field");
      b.StaticField<&Mock::limit>("limit");
      b.Method<&Mock::method>("method");
      b.Method<&Mock::sum>("sum");
      b.StaticMethod<&Mock::twice>("twice");
      b.MethodAttribute<&Mock::sum>("pure", true);
    }
  };

  struct Parent
  {
    int id{0};
    int getId() const { return id; }

    friend void NginReflect(NGIN::Mirror::Tag<Parent>, NGIN::Mirror::TypeBuilder<Parent> &b)
    {
      b.SetName("WrapDispatch::Parent");
      b.Field<&Parent::id>("id");
      b.Method<&Parent::getId>("getId");
    }
  };

  struct Child : Parent
  {
    int extra{0};
    int secret{0};

    friend void NginReflect(NGIN::Mirror::Tag<Child>, NGIN::Mirror::TypeBuilder<Child> &b)
    {
      b.SetName("WrapDispatch::Child");
      b.Base<Parent>();
      b.Field<&Child::extra>("extra");
      b.SetAccess(NGIN::Mirror::Access::Protected);
      b.Field<&Child::secret>("secret");
    }
  };

  NGIN::Mirror::MemberWrap FieldWrap() { return NGIN::Mirror::MemberWrap::Find<Mock>("field"); }
  NGIN::Mirror::MemberWrap MethodWrap() { return NGIN::Mirror::MemberWrap::Find<Mock>("method"); }
  NGIN::Mirror::MemberWrap ConstructorWrap() { return NGIN::Mirror::MemberWrap::ForConstructor<Mock, Mock>(); }
} // namespace WrapDispatchDemo

TEST_CASE("VisitExecutableRunsOnlyForExecutables", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  using namespace WrapDispatchDemo;
  auto run = [](const MemberWrap &w)
  {
    return w.VisitExecutable([](const Executable &) -> std::string { return "string"; },
                             []() -> std::string { return {}; });
  };
  CHECK(run(MemberWrap{}).empty());
  CHECK(run(MethodWrap()) == "string");
  CHECK(run(ConstructorWrap()) == "string");
  CHECK(run(FieldWrap()).empty());
}

TEST_CASE("VisitMemberRunsForAnyHeldMember", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  using namespace WrapDispatchDemo;
  auto run = [](const MemberWrap &w)
  {
    return w.VisitMember([](const auto &) -> std::string { return "string"; },
                         []() -> std::string { return {}; });
  };
  CHECK(run(MemberWrap{}).empty());
  CHECK(run(MethodWrap()) == "string");
  CHECK(run(FieldWrap()) == "string");
  CHECK(run(ConstructorWrap()) == "string");
}

TEST_CASE("VisitSelectsCallbackByKind", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  using namespace WrapDispatchDemo;
  auto which = [](const MemberWrap &w)
  {
    return w.Visit([](const Field &) { return 1; },
                   [](const Method &) { return 2; },
                   [](const Constructor &) { return 3; },
                   []() { return 0; });
  };
  CHECK(which(FieldWrap()) == 1);
  CHECK(which(MethodWrap()) == 2);
  CHECK(which(ConstructorWrap()) == 3);
  CHECK(which(MemberWrap{}) == 0);
}

TEST_CASE("EmptyWrapReportsDefaults", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  MemberWrap wrap;
  CHECK(wrap.Name() == std::string_view{"null"});
  CHECK(wrap.Signature() == "null");
  CHECK(wrap.ToString() == "null");
  CHECK(wrap.GetModifiers() == ModifierFlags::None);
  CHECK(wrap.ParameterCount() == -1);
  CHECK(wrap.ParameterTypeIds().Size() == 0);
  CHECK(wrap.ReturnTypeId() == 0);
  CHECK_FALSE(wrap.DeclaringType().IsValid());
  CHECK(wrap.AttributeCount() == 0);
  CHECK_FALSE(wrap.HasAttribute("pure"));
  CHECK_FALSE(wrap.IsAccessible());
  wrap.SetAccessible(true);
  CHECK(wrap.Hash() == 0);
}

TEST_CASE("FieldWrapHasNoParameterCount", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  auto wrap = WrapDispatchDemo::FieldWrap();
  CHECK(wrap.ParameterCount() == -1);
  CHECK(wrap.ReturnTypeId() == detail::TypeIdOf<int>());
  CHECK(wrap.DeclaringType() == GetType<WrapDispatchDemo::Mock>());
}

TEST_CASE("ParameterQueriesPassThrough", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  MemberWrap wrap{GetType<WrapDispatchDemo::Mock>().GetMethod("sum").value()};
  REQUIRE(wrap.ParameterCount() == 2);
  auto ids = wrap.ParameterTypeIds();
  REQUIRE(ids.Size() == 2);
  CHECK(ids[0] == detail::TypeIdOf<int>());
  CHECK(ids[1] == detail::TypeIdOf<float>());
  CHECK(wrap.ParameterTypeNames()[1] == NGIN::Meta::TypeName<float>::qualifiedName);
  CHECK(wrap.ReturnTypeId() == detail::TypeIdOf<int>());
  CHECK(wrap.HasAttribute("pure"));
  CHECK(wrap.AttributeAt(0).Key() == std::string_view{"pure"});
}

TEST_CASE("SignatureRendersModifiersNameAndParameters", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  const std::string intName{NGIN::Meta::TypeName<int>::qualifiedName};
  const std::string floatName{NGIN::Meta::TypeName<float>::qualifiedName};
  auto t = GetType<WrapDispatchDemo::Mock>();

  CHECK(WrapDispatchDemo::FieldWrap().Signature() == "public field");
  CHECK(MemberWrap{t.GetField("limit").value()}.Signature() == "public static const limit");
  CHECK(WrapDispatchDemo::MethodWrap().Signature() == "public method()");
  CHECK(MemberWrap{t.GetMethod("sum").value()}.Signature() == "public sum(" + intName + ", " + floatName + ") const");
  CHECK(MemberWrap{t.GetMethod("twice").value()}.Signature() == "public static twice(" + intName + ")");
  CHECK(WrapDispatchDemo::ConstructorWrap().Signature() == "public WrapDispatch::Mock()");
  CHECK(WrapDispatchDemo::ConstructorWrap().ToString() == WrapDispatchDemo::ConstructorWrap().Signature());
}

TEST_CASE("EqualityFollowsTheHeldMember", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  using namespace WrapDispatchDemo;
  auto t = GetType<Mock>();
  CHECK(FieldWrap() == FieldWrap());
  CHECK(FieldWrap() == t.GetField("field").value());
  CHECK_FALSE(FieldWrap() == t.GetField("limit").value());
  CHECK(MethodWrap() == t.GetMethod("method").value());
  CHECK(ConstructorWrap() == t.ConstructorAt(0));
  CHECK_FALSE(FieldWrap() == MethodWrap());
  CHECK_FALSE(MethodWrap() == t.ConstructorAt(0));
  CHECK(MemberWrap{} == MemberWrap{});
}

TEST_CASE("HashIsStablePerMember", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  using namespace WrapDispatchDemo;
  CHECK(FieldWrap().Hash() == FieldWrap().Hash());
  CHECK(FieldWrap().Hash() != 0);
  CHECK(FieldWrap().Hash() != MethodWrap().Hash());
  CHECK(MethodWrap().Hash() != ConstructorWrap().Hash());

  std::unordered_set<MemberWrap> seen;
  seen.insert(FieldWrap());
  seen.insert(FieldWrap());
  seen.insert(MethodWrap());
  seen.insert(MemberWrap{});
  CHECK(seen.size() == 3);
}

TEST_CASE("FieldsListsPublicInheritedThenDeclared", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  auto child = GetType<WrapDispatchDemo::Child>();
  auto fields = MemberWrap::Fields(child);
  REQUIRE(fields.Size() == 3);
  CHECK(fields[0].Name() == std::string_view{"extra"});
  CHECK(fields[1].Name() == std::string_view{"id"});
  CHECK(fields[1].DeclaringType() == GetType<WrapDispatchDemo::Parent>());
  CHECK(fields[2].Name() == std::string_view{"secret"});
  CHECK(HasFlag(fields[2].GetModifiers(), ModifierFlags::Protected));
}

TEST_CASE("MembersListsFieldsThenMethods", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  auto child = GetType<WrapDispatchDemo::Child>();
  REQUIRE(child.ConstructorCount() == 1);
  auto members = MemberWrap::Members(child);
  REQUIRE(members.Size() == 4);
  CHECK(members[0].IsField());
  CHECK(members[2].IsField());
  CHECK(members[3].IsMethod());
  CHECK(members[3].Name() == std::string_view{"getId"});
  for (NGIN::UIntSize i = 0; i < members.Size(); ++i)
    CHECK_FALSE(members[i].IsConstructor());
}

TEST_CASE("GetterFromBaseReadsDerivedReceiver", "[mirror][MemberWrapDispatch]")
{
  using namespace NGIN::Mirror;
  WrapDispatchDemo::Child d{};
  d.id = 77;
  auto wrap = MemberWrap::Find<WrapDispatchDemo::Child>("id");
  REQUIRE(wrap.IsMethod());
  CHECK(wrap.Name() == std::string_view{"getId"});
  CHECK(wrap.GetAs<int>(d).value() == 77);
}
