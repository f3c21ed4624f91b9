// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL hook to describe members
#pragma once

#include <NGIN/Mirror/Registry.hpp>
#include <NGIN/Mirror/NameUtils.hpp>
#include <NGIN/Mirror/Convert.hpp>

#include <exception>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Mirror
{

  // ==== Invocation machinery ====
  namespace detail
  {
    template <class R, class... A>
    struct InvokeArgs
    {
      static constexpr NGIN::UIntSize Arity = sizeof...(A);

      template <class Call>
      static std::expected<Any, Error> Run(Call &&call, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        return RunIndexed(call, args, std::index_sequence_for<A...>{});
      }

    private:
      template <class Call, std::size_t... I>
      static std::expected<Any, Error> RunIndexed(Call &call, const Any *args, std::index_sequence<I...>)
      {
        std::tuple<std::expected<std::remove_cvref_t<A>, Error>...> converted{ConvertAny<A>(args[I])...};
        std::optional<Error> failure;
        (
            [&]
            {
              if (!failure && !std::get<I>(converted).has_value())
                failure = std::get<I>(converted).error();
            }(),
            ...);
        if (failure)
          return std::unexpected(std::move(*failure));
        try
        {
          if constexpr (std::is_void_v<R>)
          {
            call(std::move(*std::get<I>(converted))...);
            return Any::MakeVoid();
          }
          else if constexpr (std::is_reference_v<R>)
          {
            using V = std::remove_cvref_t<R>;
            if constexpr (std::is_copy_constructible_v<V>)
            {
              return Any{V(call(std::move(*std::get<I>(converted))...))};
            }
            else
            {
              call(std::move(*std::get<I>(converted))...);
              return Any::MakeVoid();
            }
          }
          else
          {
            return Any{call(std::move(*std::get<I>(converted))...)};
          }
        }
        catch (const std::exception &e)
        {
          return std::unexpected(Error{ErrorCode::InvocationFailed, e.what()});
        }
      }
    };

    template <class F>
    struct CallableTraits;

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Object = C;
      using Ret = R;
      using Args = InvokeArgs<R, A...>;
      using ParamTuple = std::tuple<A...>;
      static constexpr bool IsConst = false;
      static constexpr bool IsStatic = false;
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...) const> : CallableTraits<R (C::*)(A...)>
    {
      using Object = const C;
      static constexpr bool IsConst = true;
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...) noexcept> : CallableTraits<R (C::*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...) const noexcept> : CallableTraits<R (C::*)(A...) const>
    {
    };

    template <class R, class... A>
    struct CallableTraits<R (*)(A...)>
    {
      using Class = void;
      using Object = void;
      using Ret = R;
      using Args = InvokeArgs<R, A...>;
      using ParamTuple = std::tuple<A...>;
      static constexpr bool IsConst = false;
      static constexpr bool IsStatic = true;
    };

    template <class R, class... A>
    struct CallableTraits<R (*)(A...) noexcept> : CallableTraits<R (*)(A...)>
    {
    };

    template <auto Fn>
    std::expected<Any, Error> Invoker(void *obj, const Any *args, NGIN::UIntSize count)
    {
      using Traits = CallableTraits<decltype(Fn)>;
      if constexpr (Traits::IsStatic)
      {
        return Traits::Args::Run([](auto &&...a) -> decltype(auto)
                                 { return Fn(std::forward<decltype(a)>(a)...); },
                                 args, count);
      }
      else
      {
        auto *self = static_cast<typename Traits::Object *>(obj);
        return Traits::Args::Run([self](auto &&...a) -> decltype(auto)
                                 { return (self->*Fn)(std::forward<decltype(a)>(a)...); },
                                 args, count);
      }
    }

    template <class Tuple, std::size_t... I>
    inline void PushParamTypes(NGIN::Containers::Vector<NGIN::UInt64> &ids,
                               NGIN::Containers::Vector<std::string_view> &names,
                               std::index_sequence<I...>)
    {
      (ids.PushBack(TypeIdOf<std::tuple_element_t<I, Tuple>>()), ...);
      (names.PushBack(TypeNameOf<std::tuple_element_t<I, Tuple>>()), ...);
    }

    // Field thunks; `Ptr` is either a pointer to data member or a pointer to a static variable.
    template <class P>
    struct FieldPtrDecompose;
    template <class M>
    struct FieldPtrDecompose<M *>
    {
      using Class = void;
      using Member = M;
      static constexpr bool IsStatic = true;
    };
    template <class C, class M>
    struct FieldPtrDecompose<M C::*>
    {
      using Class = C;
      using Member = M;
      static constexpr bool IsStatic = false;
    };

    template <auto Ptr>
    struct FieldPtrTraits : FieldPtrDecompose<decltype(Ptr)>
    {
      using Base = FieldPtrDecompose<decltype(Ptr)>;
      using Value = std::remove_cv_t<typename Base::Member>;

      static const Value &Ref(const void *obj)
      {
        if constexpr (Base::IsStatic)
          return *Ptr;
        else
          return static_cast<const typename Base::Class *>(obj)->*Ptr;
      }

      static Value &Mut(void *obj)
      {
        if constexpr (Base::IsStatic)
          return *Ptr;
        else
          return static_cast<typename Base::Class *>(obj)->*Ptr;
      }
    };

    template <auto Ptr>
    static Any FieldLoad(const void *obj)
    {
      using Traits = FieldPtrTraits<Ptr>;
      return Any{typename Traits::Value(Traits::Ref(obj))};
    }

    template <auto Ptr>
    static std::expected<void, Error> FieldStore(void *obj, const Any &value)
    {
      using Traits = FieldPtrTraits<Ptr>;
      if constexpr (std::is_const_v<typename Traits::Member>)
      {
        return std::unexpected(Error{ErrorCode::AccessDenied, "field is read-only"});
      }
      else
      {
        auto converted = ConvertAny<typename Traits::Value>(value);
        if (!converted)
          return std::unexpected(std::move(converted.error()));
        Traits::Mut(obj) = std::move(*converted);
        return {};
      }
    }

    // Ensure a type is present; returns the type index
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(TypeNameOf<U>());
      rec.qualifiedName = NameFromId(rec.qualifiedNameId);
      rec.typeId = tid;
      rec.sizeBytes = sizeof(U);
      rec.alignBytes = alignof(U);
      if constexpr (std::is_copy_constructible_v<U>)
      {
        rec.Box = [](const void *obj) -> Any
        { return Any{U(*static_cast<const U *>(obj))}; };
      }

      if constexpr (std::is_default_constructible_v<U>)
      {
        CtorRuntimeDesc c{};
        c.Construct = [](const Any *args, NGIN::UIntSize count) -> std::expected<Any, Error>
        { return InvokeArgs<U>::Run([] { return U{}; }, args, count); };
        rec.constructors.PushBack(std::move(c));
      }

      const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
      reg.types.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      reg.byName.Insert(reg.types[idx].qualifiedNameId, idx);
#if defined(_MSC_VER)
      {
        // MSVC prefixes qualified names with "class "/"struct "; index the trimmed spelling too.
        auto qn = reg.types[idx].qualifiedName;
        for (std::string_view prefix : {std::string_view{"class "}, std::string_view{"struct "}, std::string_view{"union "}})
        {
          if (qn.size() > prefix.size() && qn.substr(0, prefix.size()) == prefix)
            reg.byName.Insert(InternNameId(qn.substr(prefix.size())), idx);
        }
      }
#endif

      if constexpr (HasNginReflectWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NginReflect(Tag<U>{}, b);
      }
      else if constexpr (HasDescribeWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NGIN::Mirror::Describe<U>::Do(b);
      }
      return idx;
    }
  } // namespace detail

  template <class T>
  class TypeBuilder
  {
  public:
    // Constructed by the registry when invoking the reflect hook; bound to one type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    TypeBuilder &SetName(std::string_view qualified)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(qualified);
      reg.types[m_index].qualifiedNameId = id;
      reg.types[m_index].qualifiedName = detail::NameFromId(id);
      reg.byName.Insert(id, m_index);
      return *this;
    }

    // Applies to every member registered afterwards, like an access specifier.
    TypeBuilder &SetAccess(NGIN::Mirror::Access access)
    {
      m_access = access;
      return *this;
    }

    // Data member; the name is derived from the member pointer when omitted.
    template <auto MemberPtr>
    TypeBuilder &Field(std::string_view name = {})
    {
      static_assert(std::is_member_object_pointer_v<decltype(MemberPtr)>, "Field expects a pointer to data member");
      return AddField<MemberPtr>(name);
    }

    template <auto VarPtr>
    TypeBuilder &StaticField(std::string_view name = {})
    {
      static_assert(std::is_pointer_v<decltype(VarPtr)>, "StaticField expects a pointer to a static data member");
      return AddField<VarPtr>(name);
    }

    template <auto MemFn>
    TypeBuilder &Method(std::string_view name)
    {
      using Traits = detail::CallableTraits<decltype(MemFn)>;
      static_assert(!Traits::IsStatic, "use StaticMethod for free or static functions");
      static_assert(std::is_same_v<typename Traits::Class, T>, "Method must belong to T");
      return AddMethod<MemFn>(name);
    }

    template <auto Fn>
    TypeBuilder &StaticMethod(std::string_view name)
    {
      static_assert(detail::CallableTraits<decltype(Fn)>::IsStatic, "StaticMethod expects a function pointer");
      return AddMethod<Fn>(name);
    }

    template <class... A>
    TypeBuilder &Constructor()
    {
      auto &reg = detail::GetRegistry();
      detail::CtorRuntimeDesc c{};
      c.access = m_access;
      detail::PushParamTypes<std::tuple<A...>>(c.paramTypeIds, c.paramTypeNames, std::index_sequence_for<A...>{});
      c.Construct = [](const Any *args, NGIN::UIntSize count) -> std::expected<Any, Error>
      {
        return detail::InvokeArgs<T, A...>::Run([](auto &&...a)
                                                { return T{std::forward<decltype(a)>(a)...}; },
                                                args, count);
      };
      auto &ctors = reg.types[m_index].constructors;
      if constexpr (sizeof...(A) == 0)
      {
        // An explicit zero-argument constructor replaces the implicit one.
        for (NGIN::UIntSize i = 0; i < ctors.Size(); ++i)
        {
          if (ctors[i].paramTypeIds.Size() == 0)
          {
            ctors[i] = std::move(c);
            return *this;
          }
        }
      }
      ctors.PushBack(std::move(c));
      return *this;
    }

    // Registered base of T. The downcast function is optional.
    template <class B, auto DowncastFn = nullptr>
    TypeBuilder &Base()
    {
      static_assert(std::is_base_of_v<B, T>, "B must be a base of T");
      const auto baseIdx = detail::EnsureRegistered<B>();
      auto &reg = detail::GetRegistry();
      detail::BaseRuntimeDesc d{};
      d.baseTypeIndex = baseIdx;
      d.baseTypeId = reg.types[baseIdx].typeId;
      d.Upcast = [](void *obj) -> void *
      { return static_cast<B *>(static_cast<T *>(obj)); };
      if constexpr (!std::is_same_v<decltype(DowncastFn), std::nullptr_t>)
      {
        d.Downcast = [](void *obj) -> void *
        { return DowncastFn(static_cast<B *>(obj)); };
      }
      auto &tdesc = reg.types[m_index];
      tdesc.bases.PushBack(d);
      tdesc.baseIndex.Insert(d.baseTypeId, static_cast<NGIN::UInt32>(tdesc.bases.Size() - 1));
      return *this;
    }

    TypeBuilder &Attribute(std::string_view key, const AttrValue &value)
    {
      auto &reg = detail::GetRegistry();
      reg.types[m_index].attributes.PushBack(AttributeDesc{detail::NameFromId(detail::InternNameId(key)), value});
      return *this;
    }

    template <auto Ptr>
    TypeBuilder &FieldAttribute(std::string_view key, const AttrValue &value)
    {
      auto &fields = detail::GetRegistry().types[m_index].fields;
      for (NGIN::UIntSize i = 0; i < fields.Size(); ++i)
      {
        if (fields[i].Load == &detail::FieldLoad<Ptr>)
        {
          fields[i].attributes.PushBack(AttributeDesc{detail::NameFromId(detail::InternNameId(key)), value});
          break;
        }
      }
      return *this;
    }

    template <auto Fn>
    TypeBuilder &MethodAttribute(std::string_view key, const AttrValue &value)
    {
      auto &methods = detail::GetRegistry().types[m_index].methods;
      for (NGIN::UIntSize i = 0; i < methods.Size(); ++i)
      {
        if (methods[i].Invoke == &detail::Invoker<Fn>)
        {
          methods[i].attributes.PushBack(AttributeDesc{detail::NameFromId(detail::InternNameId(key)), value});
          break;
        }
      }
      return *this;
    }

  private:
    template <auto Ptr>
    TypeBuilder &AddField(std::string_view name)
    {
      using Traits = detail::FieldPtrTraits<Ptr>;
      auto &reg = detail::GetRegistry();
      detail::FieldRuntimeDesc f{};
      f.nameId = detail::InternNameId(name.empty() ? detail::MemberNameFromPretty<Ptr>() : name);
      f.name = detail::NameFromId(f.nameId);
      f.typeId = detail::TypeIdOf<typename Traits::Value>();
      f.typeName = detail::TypeNameOf<typename Traits::Value>();
      f.sizeBytes = sizeof(typename Traits::Value);
      f.access = m_access;
      f.isStatic = Traits::IsStatic;
      f.isConst = std::is_const_v<typename Traits::Member>;
      f.Load = &detail::FieldLoad<Ptr>;
      f.Store = &detail::FieldStore<Ptr>;
      auto &tdesc = reg.types[m_index];
      tdesc.fields.PushBack(std::move(f));
      const auto newIdx = static_cast<NGIN::UInt32>(tdesc.fields.Size() - 1);
      tdesc.fieldIndex.Insert(tdesc.fields[newIdx].nameId, newIdx);
      return *this;
    }

    template <auto Fn>
    TypeBuilder &AddMethod(std::string_view name)
    {
      using Traits = detail::CallableTraits<decltype(Fn)>;
      using Ret = typename Traits::Ret;
      auto &reg = detail::GetRegistry();
      detail::MethodRuntimeDesc m{};
      m.nameId = detail::InternNameId(name);
      m.name = detail::NameFromId(m.nameId);
      if constexpr (std::is_void_v<Ret>)
      {
        m.returnTypeId = 0;
        m.returnTypeName = "void";
      }
      else
      {
        m.returnTypeId = detail::TypeIdOf<Ret>();
        m.returnTypeName = detail::TypeNameOf<Ret>();
      }
      using Params = typename Traits::ParamTuple;
      detail::PushParamTypes<Params>(m.paramTypeIds, m.paramTypeNames,
                                     std::make_index_sequence<std::tuple_size_v<Params>>{});
      m.access = m_access;
      m.isStatic = Traits::IsStatic;
      m.isConst = Traits::IsConst;
      m.Invoke = &detail::Invoker<Fn>;

      auto &tdesc = reg.types[m_index];
      tdesc.methods.PushBack(std::move(m));
      const auto newIndex = static_cast<NGIN::UInt32>(tdesc.methods.Size() - 1);
      const auto nameId = tdesc.methods[newIndex].nameId;
      if (auto *vecPtr = tdesc.methodOverloads.GetPtr(nameId))
      {
        vecPtr->PushBack(newIndex);
      }
      else
      {
        NGIN::Containers::Vector<NGIN::UInt32> v;
        v.PushBack(newIndex);
        tdesc.methodOverloads.Insert(nameId, std::move(v));
      }
      return *this;
    }

    NGIN::UInt32 m_index{0};
    NGIN::Mirror::Access m_access{NGIN::Mirror::Access::Public};
  };

} // namespace NGIN::Mirror
