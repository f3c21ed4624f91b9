// Resolver.hpp
// Name-based lookup of fields, accessor-shaped methods and constructors.
//
// Every lookup searches public members first (own, then inherited through the
// registered bases, nearest first) and falls back to all members declared on
// the type itself. Failure to resolve is reported as std::nullopt.
#pragma once

#include <NGIN/Mirror/Registry.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace NGIN::Mirror
{
  // How setter-shaped methods are recognised.
  struct AccessorConvention
  {
    // Accept `Self& setX(V)` style setters that return their declaring type.
    bool fluentSetters{true};
  };

  enum class AccessorKind : NGIN::UInt8
  {
    Getter = 0,
    Setter = 1,
  };

  // prefix + name with its first character upper-cased ("get", "count" -> "getCount").
  NGIN_MIRROR_API std::string FormatAccessorName(std::string_view prefix, std::string_view name);

  // Getter: name, getName, hasName, isName. Setter: name, setName.
  NGIN_MIRROR_API NGIN::Containers::Vector<std::string> CandidateNames(AccessorKind kind, std::string_view name);

  NGIN_MIRROR_API std::optional<Field> FindField(const Type &type, std::string_view name);

  // Exact name and parameter list.
  NGIN_MIRROR_API std::optional<Method> FindMethod(const Type &type,
                                                   std::string_view name,
                                                   std::span<const NGIN::UInt64> paramTypeIds);

  NGIN_MIRROR_API std::optional<Method> FindGetterMethod(const Type &type, std::string_view name);
  NGIN_MIRROR_API std::optional<Method> FindSetterMethod(const Type &type, std::string_view name, NGIN::UInt64 paramTypeId);

  // Getter lookup first, then the setter lookup when a parameter type is supplied.
  NGIN_MIRROR_API std::optional<Method> FindAccessorMethod(const Type &type,
                                                           std::string_view name,
                                                           std::optional<NGIN::UInt64> paramTypeId = std::nullopt);

  // One-parameter constructor taking exactly `paramTypeId`, else the zero-parameter one.
  NGIN_MIRROR_API std::optional<Constructor> FindConstructor(const Type &type, NGIN::UInt64 paramTypeId);

  NGIN_MIRROR_API bool IsGetterMethod(const Method &method);
  NGIN_MIRROR_API bool IsSetterMethod(const Method &method, const AccessorConvention &convention = {});

  template <class P>
  std::optional<Method> FindSetterMethod(const Type &type, std::string_view name)
  {
    return FindSetterMethod(type, name, detail::TypeIdOf<P>());
  }

  template <class P>
  std::optional<Constructor> FindConstructor(const Type &type)
  {
    return FindConstructor(type, detail::TypeIdOf<P>());
  }

  namespace detail
  {
    // Public members (own, then inherited) followed by the remaining declared ones.
    NGIN_MIRROR_API NGIN::Containers::Vector<Field> VisibleFields(const Type &type);
    NGIN_MIRROR_API NGIN::Containers::Vector<Method> VisibleMethods(const Type &type);
  } // namespace detail

} // namespace NGIN::Mirror
