/// @file BasicTests.cpp
/// @brief Smoke tests for type registration and lookup.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Mirror/Mirror.hpp>

namespace BasicDemo
{
  struct User
  {
    int id{0};
    float score{0.0f};

    friend void NginReflect(NGIN::Mirror::Tag<User>, NGIN::Mirror::TypeBuilder<User> &b)
    {
      b.Field<&User::id>("id");
      b.Field<&User::score>();
    }
  };

  struct Named
  {
    int value{1};

    friend void NginReflect(NGIN::Mirror::Tag<Named>, NGIN::Mirror::TypeBuilder<Named> &b)
    {
      b.SetName("Basic::Named");
      b.Field<&Named::value>("value");
    }
  };
} // namespace BasicDemo

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[mirror][Basics]")
{
  CHECK(NGIN::Mirror::LibraryName() == std::string_view{"NGIN.Mirror"});
}

TEST_CASE("QualifiedNameDefaultsFromMetaTypeName", "[mirror][Basics]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<BasicDemo::User>();
  REQUIRE(t.IsValid());
  CHECK(t.QualifiedName() == std::string_view{NGIN::Meta::TypeName<BasicDemo::User>::qualifiedName});
  CHECK(t.Size() == sizeof(BasicDemo::User));
  CHECK(t.FieldCount() == 2);
}

TEST_CASE("FieldNameIsDerivedFromMemberPointerWhenOmitted", "[mirror][Basics]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<BasicDemo::User>();
  auto f = t.FindField("score");
  REQUIRE(f.has_value());
  CHECK(f->Name() == std::string_view{"score"});
  CHECK(f->TypeId() == detail::TypeIdOf<float>());
}

TEST_CASE("CustomNameIsResolvableByString", "[mirror][Basics]")
{
  using namespace NGIN::Mirror;
  auto t = GetType<BasicDemo::Named>();
  auto byName = GetType("Basic::Named");
  REQUIRE(byName.has_value());
  CHECK(*byName == t);
  CHECK(FindTypeById(t.GetTypeId()).value() == t);
}

TEST_CASE("UnknownTypeNameReportsNotFound", "[mirror][Basics]")
{
  using namespace NGIN::Mirror;
  auto missing = GetType("Basic::DoesNotExist");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);
  CHECK_FALSE(FindType("Basic::DoesNotExist").has_value());
}

TEST_CASE("RegistrationIsIdempotent", "[mirror][Basics]")
{
  using namespace NGIN::Mirror;
  auto a = GetType<BasicDemo::User>();
  auto b = GetType<BasicDemo::User>();
  CHECK(a == b);
  CHECK(a.FieldCount() == 2);
}
