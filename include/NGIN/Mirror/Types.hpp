// Types.hpp
// Public-facing error codes, modifier flags and small index handle types
#pragma once

#include <NGIN/Mirror/Export.hpp>
#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <utility>

namespace NGIN::Mirror
{

  using Any = NGIN::Utilities::Any<>;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    AccessDenied = 3,
    IncompatibleArgument = 4,
    InvocationFailed = 5,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
  };

  // Access level a member was registered under (mirrors the C++ access specifiers).
  enum class Access : NGIN::UInt8
  {
    Public = 0,
    Protected = 1,
    Private = 2,
  };

  enum class ModifierFlags : NGIN::UInt32
  {
    None = 0,
    Public = 1u << 0,
    Protected = 1u << 1,
    Private = 1u << 2,
    Static = 1u << 3,
    Const = 1u << 4,
  };

  constexpr ModifierFlags operator|(ModifierFlags a, ModifierFlags b) noexcept
  {
    return static_cast<ModifierFlags>(static_cast<NGIN::UInt32>(a) | static_cast<NGIN::UInt32>(b));
  }

  constexpr ModifierFlags operator&(ModifierFlags a, ModifierFlags b) noexcept
  {
    return static_cast<ModifierFlags>(static_cast<NGIN::UInt32>(a) & static_cast<NGIN::UInt32>(b));
  }

  constexpr ModifierFlags operator~(ModifierFlags a) noexcept
  {
    return static_cast<ModifierFlags>(~static_cast<NGIN::UInt32>(a));
  }

  constexpr bool HasFlag(ModifierFlags set, ModifierFlags flag) noexcept
  {
    return (set & flag) != ModifierFlags::None;
  }

  // Renders the keywords in declaration order, e.g. "private static const".
  NGIN_MIRROR_API std::string ModifiersToString(ModifierFlags flags);

  // Small opaque handles (indices into the registry tables).
  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const TypeHandle &) const noexcept = default;
  };

  struct FieldHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 fieldIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && fieldIndex != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const FieldHandle &) const noexcept = default;
  };

  struct MethodHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 methodIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && methodIndex != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const MethodHandle &) const noexcept = default;
  };

  struct ConstructorHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 ctorIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && ctorIndex != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const ConstructorHandle &) const noexcept = default;
  };

  struct BaseHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 baseIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && baseIndex != static_cast<NGIN::UInt32>(-1); }
  };

  enum class MemberKind : unsigned char
  {
    Field = 0,
    Method = 1,
    Constructor = 2,
  };

  // Forward decls of high-level wrappers
  class Type;
  class Field;
  class Method;
  class Constructor;
  class Executable;
  class Base;
  class MemberWrap;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedField = std::expected<Field, Error>;
  using ExpectedMethod = std::expected<Method, Error>;
  using ExpectedBase = std::expected<Base, Error>;

} // namespace NGIN::Mirror
