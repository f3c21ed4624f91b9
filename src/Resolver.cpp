#include <NGIN/Mirror/Resolver.hpp>
#include <NGIN/Mirror/Log.hpp>

#include <cctype>

namespace NGIN::Mirror
{
  namespace
  {
    struct FieldTable
    {
      using Wrapper = Field;
      static constexpr bool Inherited = true;
      static NGIN::UIntSize Count(const Type &t) { return t.FieldCount(); }
      static Field At(const Type &t, NGIN::UIntSize i) { return t.FieldAt(i); }
    };

    struct MethodTable
    {
      using Wrapper = Method;
      static constexpr bool Inherited = true;
      static NGIN::UIntSize Count(const Type &t) { return t.MethodCount(); }
      static Method At(const Type &t, NGIN::UIntSize i) { return t.MethodAt(i); }
    };

    struct CtorTable
    {
      using Wrapper = Constructor;
      static constexpr bool Inherited = false;
      static NGIN::UIntSize Count(const Type &t) { return t.ConstructorCount(); }
      static Constructor At(const Type &t, NGIN::UIntSize i) { return t.ConstructorAt(i); }
    };

    template <class Table, class Pred>
    std::optional<typename Table::Wrapper> SearchPublic(const Type &type, Pred &pred)
    {
      for (NGIN::UIntSize i = 0; i < Table::Count(type); ++i)
      {
        auto member = Table::At(type, i);
        if (member.GetAccess() == Access::Public && pred(member))
          return member;
      }
      if constexpr (Table::Inherited)
      {
        for (NGIN::UIntSize b = 0; b < type.BaseCount(); ++b)
        {
          if (auto hit = SearchPublic<Table>(type.BaseAt(b).BaseType(), pred))
            return hit;
        }
      }
      return std::nullopt;
    }

    template <class Table, class Pred>
    std::optional<typename Table::Wrapper> SearchDeclared(const Type &type, Pred &pred)
    {
      for (NGIN::UIntSize i = 0; i < Table::Count(type); ++i)
      {
        auto member = Table::At(type, i);
        if (pred(member))
          return member;
      }
      return std::nullopt;
    }

    // The single search routine every lookup goes through.
    template <class Table, class Pred>
    std::optional<typename Table::Wrapper> SearchMembers(const Type &type, Pred pred)
    {
      if (!type.IsValid())
        return std::nullopt;
      if (auto hit = SearchPublic<Table>(type, pred))
        return hit;
      return SearchDeclared<Table>(type, pred);
    }

    template <class W>
    void PushUnique(NGIN::Containers::Vector<W> &out, const W &member)
    {
      for (NGIN::UIntSize i = 0; i < out.Size(); ++i)
        if (out[i] == member)
          return;
      out.PushBack(member);
    }

    template <class Table>
    void CollectPublic(const Type &type, NGIN::Containers::Vector<typename Table::Wrapper> &out)
    {
      for (NGIN::UIntSize i = 0; i < Table::Count(type); ++i)
      {
        auto member = Table::At(type, i);
        if (member.GetAccess() == Access::Public)
          PushUnique(out, member);
      }
      if constexpr (Table::Inherited)
      {
        for (NGIN::UIntSize b = 0; b < type.BaseCount(); ++b)
          CollectPublic<Table>(type.BaseAt(b).BaseType(), out);
      }
    }

    template <class Table>
    NGIN::Containers::Vector<typename Table::Wrapper> CollectVisible(const Type &type)
    {
      NGIN::Containers::Vector<typename Table::Wrapper> out;
      if (!type.IsValid())
        return out;
      CollectPublic<Table>(type, out);
      for (NGIN::UIntSize i = 0; i < Table::Count(type); ++i)
        PushUnique(out, Table::At(type, i));
      return out;
    }

    // Names never interned cannot belong to any registered member.
    bool IsKnownName(std::string_view name)
    {
      NameId id{};
      return detail::FindNameId(name, id);
    }

    template <class Exec>
    bool ParametersMatch(const Exec &exec, std::span<const NGIN::UInt64> paramTypeIds)
    {
      if (exec.ParameterCount() != paramTypeIds.size())
        return false;
      for (NGIN::UIntSize i = 0; i < paramTypeIds.size(); ++i)
        if (exec.ParameterTypeId(i) != paramTypeIds[i])
          return false;
      return true;
    }
  } // namespace

  std::string FormatAccessorName(std::string_view prefix, std::string_view name)
  {
    std::string out;
    out.reserve(prefix.size() + name.size());
    out.append(prefix);
    if (name.empty())
      return out;
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(name.front()))));
    out.append(name.substr(1));
    return out;
  }

  NGIN::Containers::Vector<std::string> CandidateNames(AccessorKind kind, std::string_view name)
  {
    NGIN::Containers::Vector<std::string> out;
    out.PushBack(std::string{name});
    if (kind == AccessorKind::Getter)
    {
      out.PushBack(FormatAccessorName("get", name));
      out.PushBack(FormatAccessorName("has", name));
      out.PushBack(FormatAccessorName("is", name));
    }
    else
    {
      out.PushBack(FormatAccessorName("set", name));
    }
    return out;
  }

  std::optional<Field> FindField(const Type &type, std::string_view name)
  {
    if (!IsKnownName(name))
      return std::nullopt;
    return SearchMembers<FieldTable>(type, [name](const Field &f) { return f.Name() == name; });
  }

  std::optional<Method> FindMethod(const Type &type, std::string_view name, std::span<const NGIN::UInt64> paramTypeIds)
  {
    if (!IsKnownName(name))
      return std::nullopt;
    return SearchMembers<MethodTable>(type, [name, paramTypeIds](const Method &m)
                                      { return m.Name() == name && ParametersMatch(m, paramTypeIds); });
  }

  std::optional<Method> FindGetterMethod(const Type &type, std::string_view name)
  {
    const auto candidates = CandidateNames(AccessorKind::Getter, name);
    for (NGIN::UIntSize i = 0; i < candidates.Size(); ++i)
    {
      if (auto m = FindMethod(type, candidates[i], {}))
      {
        NGIN_MIRROR_TRACE("getter '{}' on {} resolved to {}", name, type.QualifiedName(), candidates[i]);
        return m;
      }
    }
    NGIN_MIRROR_TRACE("no getter '{}' on {}", name, type.QualifiedName());
    return std::nullopt;
  }

  std::optional<Method> FindSetterMethod(const Type &type, std::string_view name, NGIN::UInt64 paramTypeId)
  {
    const NGIN::UInt64 params[1] = {paramTypeId};
    const auto candidates = CandidateNames(AccessorKind::Setter, name);
    for (NGIN::UIntSize i = 0; i < candidates.Size(); ++i)
    {
      if (auto m = FindMethod(type, candidates[i], params))
      {
        NGIN_MIRROR_TRACE("setter '{}' on {} resolved to {}", name, type.QualifiedName(), candidates[i]);
        return m;
      }
    }
    NGIN_MIRROR_TRACE("no setter '{}' on {}", name, type.QualifiedName());
    return std::nullopt;
  }

  std::optional<Method> FindAccessorMethod(const Type &type, std::string_view name, std::optional<NGIN::UInt64> paramTypeId)
  {
    if (auto getter = FindGetterMethod(type, name))
      return getter;
    if (paramTypeId)
      return FindSetterMethod(type, name, *paramTypeId);
    return std::nullopt;
  }

  std::optional<Constructor> FindConstructor(const Type &type, NGIN::UInt64 paramTypeId)
  {
    const NGIN::UInt64 params[1] = {paramTypeId};
    if (auto c = SearchMembers<CtorTable>(type, [&params](const Constructor &ctor) { return ParametersMatch(ctor, params); }))
      return c;
    auto fallback = SearchMembers<CtorTable>(type, [](const Constructor &ctor) { return ctor.ParameterCount() == 0; });
    NGIN_MIRROR_TRACE("constructor of {} {}", type.QualifiedName(), fallback ? "fell back to zero parameters" : "not found");
    return fallback;
  }

  bool IsGetterMethod(const Method &method)
  {
    return method.IsValid() && method.ParameterCount() == 0 && !method.ReturnsVoid();
  }

  bool IsSetterMethod(const Method &method, const AccessorConvention &convention)
  {
    if (!method.IsValid() || method.ParameterCount() != 1)
      return false;
    if (method.ReturnsVoid())
      return true;
    return convention.fluentSetters && method.ReturnTypeId() == method.DeclaringType().GetTypeId();
  }

  namespace detail
  {
    NGIN::Containers::Vector<Field> VisibleFields(const Type &type) { return CollectVisible<FieldTable>(type); }
    NGIN::Containers::Vector<Method> VisibleMethods(const Type &type) { return CollectVisible<MethodTable>(type); }
  } // namespace detail

} // namespace NGIN::Mirror
