// MemberWrap.hpp
// One handle over a field, a method or a constructor (or nothing).
//
// MemberWrap lets callers read or assign a named property, or invoke a
// constructor-like accessor, without branching on the kind of member that
// backs it. Every operation is expressed through the Visit* dispatch
// primitives below. Reads and writes come in two forms: GetChecked/SetChecked
// surface the failure, Get/Set swallow it into "no value" / false.
#pragma once

#include <NGIN/Mirror/Registry.hpp>
#include <NGIN/Mirror/Resolver.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace NGIN::Mirror
{
  class NGIN_MIRROR_API MemberWrap
  {
  public:
    MemberWrap() = default;
    MemberWrap(const Field &field);
    MemberWrap(const Method &method);
    MemberWrap(const Constructor &constructor);
    MemberWrap(const Executable &executable);
    MemberWrap(const std::optional<Field> &field);
    MemberWrap(const std::optional<Method> &method);
    MemberWrap(const std::optional<Constructor> &constructor);

    // First non-empty candidate, left to right.
    static MemberWrap FirstOf(std::initializer_list<MemberWrap> candidates);

    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, MemberWrap>
    static MemberWrap FirstOf(R &&candidates)
    {
      for (auto &&candidate : candidates)
      {
        MemberWrap wrap{candidate};
        if (!wrap.IsEmpty())
          return wrap;
      }
      return MemberWrap{};
    }

    // Getter-shaped method, then field.
    static MemberWrap Find(const Type &type, std::string_view name);
    // Setter taking `valueType`, field, getter, then a constructor of `valueType` taking `type`.
    static MemberWrap Find(const Type &type, std::string_view name, const Type &valueType);
    // Constructor of `constructedType` taking `paramType`, else its zero-parameter constructor.
    static MemberWrap ForConstructor(const Type &paramType, const Type &constructedType);

    template <class C>
    static MemberWrap Find(std::string_view name)
    {
      return Find(GetType<C>(), name);
    }

    template <class C, class V>
    static MemberWrap Find(std::string_view name)
    {
      return Find(GetType<C>(), name, GetType<V>());
    }

    template <class P, class C>
    static MemberWrap ForConstructor()
    {
      return ForConstructor(GetType<P>(), GetType<C>());
    }

    // Wrapped public members (own and inherited), then the remaining declared ones.
    static NGIN::Containers::Vector<MemberWrap> Fields(const Type &type);
    static NGIN::Containers::Vector<MemberWrap> Methods(const Type &type);
    // Fields then methods. Constructors are reached through ForConstructor.
    static NGIN::Containers::Vector<MemberWrap> Members(const Type &type);

    [[nodiscard]] bool IsEmpty() const noexcept { return std::holds_alternative<std::monostate>(m_member); }
    [[nodiscard]] bool IsMember() const noexcept { return !IsEmpty(); }
    [[nodiscard]] bool IsField() const noexcept { return std::holds_alternative<Field>(m_member); }
    [[nodiscard]] bool IsMethod() const noexcept { return std::holds_alternative<Method>(m_member); }
    [[nodiscard]] bool IsConstructor() const noexcept { return std::holds_alternative<Constructor>(m_member); }
    [[nodiscard]] bool IsExecutable() const noexcept { return IsMethod() || IsConstructor(); }
    [[nodiscard]] std::optional<MemberKind> Kind() const noexcept;
    explicit operator bool() const noexcept { return IsMember(); }

    [[nodiscard]] std::optional<Field> AsField() const;
    [[nodiscard]] std::optional<Method> AsMethod() const;
    [[nodiscard]] std::optional<Constructor> AsConstructor() const;
    [[nodiscard]] std::optional<Executable> AsExecutable() const;

    [[nodiscard]] bool IsSettable(const AccessorConvention &convention = {}) const;
    [[nodiscard]] bool IsGettable() const;

    // Field read, zero-parameter method call, or constructor call. A zero-parameter
    // constructor ignores the receiver; a one-parameter constructor receives it.
    [[nodiscard]] std::expected<Any, Error> GetChecked(ObjectRef obj) const;
    // Void Any when nothing was produced.
    [[nodiscard]] Any Get(ObjectRef obj) const;

    template <class T>
    [[nodiscard]] std::optional<std::remove_cvref_t<T>> GetAs(ObjectRef obj) const
    {
      using U = std::remove_cvref_t<T>;
      auto any = Get(obj);
      if (!any.HasValue() || any.GetTypeId() != detail::TypeIdOf<U>())
        return std::nullopt;
      return any.template Cast<U>();
    }

    // true when a field store or setter call happened; false for constructors and empty.
    [[nodiscard]] std::expected<bool, Error> SetChecked(ObjectRef obj, const Any &value) const;
    bool Set(ObjectRef obj, const Any &value) const;

    template <class T>
    requires (!std::is_same_v<std::remove_cvref_t<T>, Any>)
    bool Set(ObjectRef obj, T &&value) const
    {
      return Set(obj, Any{std::forward<T>(value)});
    }

    // "null" when empty; a constructor is named after its declaring type.
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] ModifierFlags GetModifiers() const;
    [[nodiscard]] Type DeclaringType() const;
    // -1 unless executable.
    [[nodiscard]] int ParameterCount() const;
    // Empty unless executable.
    [[nodiscard]] NGIN::Containers::Vector<NGIN::UInt64> ParameterTypeIds() const;
    [[nodiscard]] NGIN::Containers::Vector<std::string_view> ParameterTypeNames() const;
    // Field type, method return type (0 for void) or constructed type; 0 when empty.
    [[nodiscard]] NGIN::UInt64 ReturnTypeId() const;

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeView AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;
    [[nodiscard]] bool HasAttribute(std::string_view key) const { return Attribute(key).has_value(); }

    [[nodiscard]] bool IsAccessible() const;
    // Mutates the shared member metadata; no-op when empty.
    void SetAccessible(bool flag) const;

    [[nodiscard]] std::string Signature() const;
    [[nodiscard]] std::string ToString() const { return Signature(); }

    [[nodiscard]] NGIN::UInt64 Hash() const noexcept;

    [[nodiscard]] bool operator==(const MemberWrap &other) const noexcept { return m_member == other.m_member; }
    [[nodiscard]] bool operator==(const Field &field) const noexcept;
    [[nodiscard]] bool operator==(const Method &method) const noexcept;
    [[nodiscard]] bool operator==(const Constructor &constructor) const noexcept;

    // Dispatch on the held kind; every callback must yield the fallback's result type.
    template <class OnField, class OnMethod, class OnConstructor, class OnEmpty>
    decltype(auto) Visit(OnField &&onField, OnMethod &&onMethod, OnConstructor &&onConstructor, OnEmpty &&onEmpty) const
    {
      using R = std::invoke_result_t<OnEmpty>;
      if (auto *f = std::get_if<Field>(&m_member))
        return static_cast<R>(std::invoke(std::forward<OnField>(onField), *f));
      if (auto *m = std::get_if<Method>(&m_member))
        return static_cast<R>(std::invoke(std::forward<OnMethod>(onMethod), *m));
      if (auto *c = std::get_if<Constructor>(&m_member))
        return static_cast<R>(std::invoke(std::forward<OnConstructor>(onConstructor), *c));
      return static_cast<R>(std::invoke(std::forward<OnEmpty>(onEmpty)));
    }

    template <class OnExecutable, class OnOther>
    decltype(auto) VisitExecutable(OnExecutable &&onExecutable, OnOther &&onOther) const
    {
      using R = std::invoke_result_t<OnOther>;
      if (auto *m = std::get_if<Method>(&m_member))
        return static_cast<R>(std::invoke(std::forward<OnExecutable>(onExecutable), Executable{*m}));
      if (auto *c = std::get_if<Constructor>(&m_member))
        return static_cast<R>(std::invoke(std::forward<OnExecutable>(onExecutable), Executable{*c}));
      return static_cast<R>(std::invoke(std::forward<OnOther>(onOther)));
    }

    // `onMember` must accept Field, Method and Constructor (a generic lambda does).
    template <class OnMember, class OnEmpty>
    decltype(auto) VisitMember(OnMember &&onMember, OnEmpty &&onEmpty) const
    {
      return Visit(onMember, onMember, onMember, std::forward<OnEmpty>(onEmpty));
    }

  private:
    std::variant<std::monostate, Field, Method, Constructor> m_member{};
  };

} // namespace NGIN::Mirror

template <>
struct std::hash<NGIN::Mirror::MemberWrap>
{
  std::size_t operator()(const NGIN::Mirror::MemberWrap &wrap) const noexcept
  {
    return static_cast<std::size_t>(wrap.Hash());
  }
};
