// Registry.hpp
// Process-wide member registry and the query wrappers built on top of it
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <NGIN/Mirror/Export.hpp>
#include <NGIN/Mirror/Types.hpp>

namespace NGIN::Mirror
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Customization point for types you cannot modify
  // Specialize in namespace NGIN::Mirror: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  using AttrValue = std::variant<bool, std::int64_t, double, std::string_view, NGIN::UInt64>;

  struct AttributeDesc
  {
    std::string_view key;
    AttrValue value;
  };

  class AttributeView;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    NGIN_MIRROR_API NameId InternNameId(std::string_view s) noexcept;
    NGIN_MIRROR_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    NGIN_MIRROR_API std::string_view NameFromId(NameId id) noexcept;

    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    template <class T>
    inline constexpr std::string_view TypeNameOf()
    {
      return NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
    }

    struct FieldRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      std::string_view typeName;
      NGIN::UIntSize sizeBytes{0};
      Access access{Access::Public};
      bool isStatic{false};
      bool isConst{false};
      bool accessible{false};
      Any (*Load)(const void *){nullptr};
      std::expected<void, Error> (*Store)(void *, const Any &){nullptr};
      NGIN::Containers::Vector<AttributeDesc> attributes;
    };

    struct MethodRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 returnTypeId{0}; // 0 == void
      std::string_view returnTypeName;
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      NGIN::Containers::Vector<std::string_view> paramTypeNames;
      Access access{Access::Public};
      bool isStatic{false};
      bool isConst{false};
      bool accessible{false};
      std::expected<Any, Error> (*Invoke)(void *, const Any *, NGIN::UIntSize){nullptr};
      NGIN::Containers::Vector<AttributeDesc> attributes;
    };

    struct CtorRuntimeDesc
    {
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      NGIN::Containers::Vector<std::string_view> paramTypeNames;
      Access access{Access::Public};
      bool accessible{false};
      std::expected<Any, Error> (*Construct)(const Any *, NGIN::UIntSize){nullptr};
      NGIN::Containers::Vector<AttributeDesc> attributes;
    };

    struct BaseRuntimeDesc
    {
      NGIN::UInt32 baseTypeIndex{static_cast<NGIN::UInt32>(-1)};
      NGIN::UInt64 baseTypeId{0};
      void *(*Upcast)(void *){nullptr};
      void *(*Downcast)(void *){nullptr};
    };

    struct TypeRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      NGIN::UIntSize sizeBytes{0};
      NGIN::UIntSize alignBytes{0};
      // Copies an instance into an Any; null for non-copyable types.
      Any (*Box)(const void *){nullptr};
      NGIN::Containers::Vector<FieldRuntimeDesc> fields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> fieldIndex;
      NGIN::Containers::Vector<MethodRuntimeDesc> methods;
      NGIN::Containers::FlatHashMap<NameId, NGIN::Containers::Vector<NGIN::UInt32>> methodOverloads;
      NGIN::Containers::Vector<CtorRuntimeDesc> constructors;
      NGIN::Containers::Vector<BaseRuntimeDesc> bases;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> baseIndex;
      NGIN::Containers::Vector<AttributeDesc> attributes;
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;

      StringInterner names;
    };

    NGIN_MIRROR_API Registry &GetRegistry() noexcept;

    // Walks the registered base chain of `fromTypeId` looking for `targetTypeId`.
    // Returns the adjusted address, or nullptr when the types are unrelated.
    NGIN_MIRROR_API void *UpcastTo(NGIN::UInt64 fromTypeId, void *obj, NGIN::UInt64 targetTypeId) noexcept;

    template <class T>
    concept HasNginReflectWithTypeBuilder = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void NginReflect(Tag<T>, TypeBuilder<T>&)
      { NginReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(NGIN::Mirror::Describe<T>::Do(std::declval<TypeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithTypeBuilder = HasDescribeImpl<T>::value;

    template <class T>
    NGIN::UInt32 EnsureRegistered();

  } // namespace detail

  // Non-owning typed reference to a receiver instance. A null ref means "no receiver".
  class ObjectRef
  {
  public:
    constexpr ObjectRef() = default;
    constexpr ObjectRef(std::nullptr_t) noexcept {}
    constexpr ObjectRef(void *ptr, NGIN::UInt64 typeId) noexcept : m_ptr(ptr), m_typeId(typeId) {}

    // Reflected receiver types are registered on first use so their bases are known to upcasts.
    template <class Obj>
    requires (!std::is_pointer_v<Obj> && !std::is_same_v<std::remove_cv_t<Obj>, ObjectRef> &&
              !std::is_same_v<std::remove_cv_t<Obj>, std::nullptr_t>)
    ObjectRef(Obj &obj)
        : m_ptr(const_cast<void *>(static_cast<const void *>(std::addressof(obj)))),
          m_typeId(detail::TypeIdOf<Obj>()),
          m_const(std::is_const_v<Obj>)
    {
      using U = std::remove_cv_t<Obj>;
      if constexpr (detail::HasNginReflectWithTypeBuilder<U> || detail::HasDescribeWithTypeBuilder<U>)
        (void)detail::EnsureRegistered<U>();
      if constexpr (std::is_copy_constructible_v<U>)
        m_box = [](const void *p) -> Any { return Any{U(*static_cast<const U *>(p))}; };
    }

    [[nodiscard]] constexpr bool IsNull() const noexcept { return m_ptr == nullptr; }
    // A const receiver may only be read or passed to const methods.
    [[nodiscard]] constexpr bool IsConst() const noexcept { return m_const; }
    [[nodiscard]] constexpr void *Data() const noexcept { return m_ptr; }
    [[nodiscard]] constexpr NGIN::UInt64 TypeId() const noexcept { return m_typeId; }
    // Copy of the referenced object; void when the object is null or not copyable.
    [[nodiscard]] Any Box() const
    {
      if (m_ptr == nullptr || m_box == nullptr)
        return Any::MakeVoid();
      return m_box(m_ptr);
    }

  private:
    void *m_ptr{nullptr};
    NGIN::UInt64 m_typeId{0};
    bool m_const{false};
    Any (*m_box)(const void *){nullptr};
  };

  class AttributeView
  {
  public:
    AttributeView() = default;
    AttributeView(std::string_view k, const AttrValue *v) : m_key(k), m_val(v) {}
    [[nodiscard]] std::string_view Key() const { return m_key; }
    [[nodiscard]] const AttrValue &Value() const { return *m_val; }

  private:
    std::string_view m_key{};
    const AttrValue *m_val{nullptr};
  };

  class NGIN_MIRROR_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      return m_h.IsValid() && m_h.index < detail::GetRegistry().types.Size();
    }
    [[nodiscard]] TypeHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] NGIN::UIntSize Size() const;
    [[nodiscard]] NGIN::UIntSize Alignment() const;

    // Declared members only; inherited members are reached through the Resolver.
    [[nodiscard]] NGIN::UIntSize FieldCount() const;
    [[nodiscard]] Field FieldAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedField GetField(std::string_view name) const;
    [[nodiscard]] std::optional<Field> FindField(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize MethodCount() const;
    [[nodiscard]] Method MethodAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedMethod GetMethod(std::string_view name) const;
    [[nodiscard]] NGIN::Containers::Vector<Method> FindMethods(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize ConstructorCount() const;
    [[nodiscard]] Constructor ConstructorAt(NGIN::UIntSize i) const;

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeView AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;

    [[nodiscard]] NGIN::UIntSize BaseCount() const;
    [[nodiscard]] Base BaseAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedBase GetBase(const Type &base) const;
    [[nodiscard]] std::optional<Base> FindBase(const Type &base) const;
    // Transitive over registered bases; a type is not derived from itself.
    [[nodiscard]] bool IsDerivedFrom(const Type &base) const;

    [[nodiscard]] bool operator==(const Type &other) const noexcept { return m_h == other.m_h; }

  private:
    TypeHandle m_h{};
  };

  class NGIN_MIRROR_API Field
  {
  public:
    constexpr Field() = default;
    explicit constexpr Field(FieldHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.fieldIndex < reg.types[m_h.typeIndex].fields.Size();
    }
    [[nodiscard]] FieldHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;
    [[nodiscard]] std::string_view TypeName() const;
    [[nodiscard]] Type DeclaringType() const;

    [[nodiscard]] Access GetAccess() const;
    [[nodiscard]] ModifierFlags GetModifiers() const;
    [[nodiscard]] bool IsStatic() const;
    [[nodiscard]] bool IsConst() const;
    [[nodiscard]] bool IsAccessible() const;
    void SetAccessible(bool flag) const;

    // Static fields ignore the receiver.
    [[nodiscard]] std::expected<Any, Error> GetValue(ObjectRef obj) const;
    [[nodiscard]] std::expected<void, Error> SetValue(ObjectRef obj, const Any &value) const;

    template <class T>
    [[nodiscard]] std::expected<std::remove_cvref_t<T>, Error> Get(ObjectRef obj) const
    {
      using U = std::remove_cvref_t<T>;
      auto any = GetValue(obj);
      if (!any)
        return std::unexpected(std::move(any.error()));
      if (any->GetTypeId() != detail::TypeIdOf<U>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "type-id mismatch"});
      return any->template Cast<U>();
    }

    template <class T>
    [[nodiscard]] std::expected<void, Error> Set(ObjectRef obj, T &&value) const
    {
      return SetValue(obj, Any{std::forward<T>(value)});
    }

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeView AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;

    [[nodiscard]] bool operator==(const Field &other) const noexcept { return m_h == other.m_h; }

  private:
    FieldHandle m_h{};
  };

  class NGIN_MIRROR_API Method
  {
  public:
    constexpr Method() = default;
    explicit constexpr Method(MethodHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.methodIndex < reg.types[m_h.typeIndex].methods.Size();
    }
    [[nodiscard]] MethodHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    [[nodiscard]] NGIN::UInt64 ParameterTypeId(NGIN::UIntSize i) const;
    [[nodiscard]] std::string_view ParameterTypeName(NGIN::UIntSize i) const;
    [[nodiscard]] NGIN::UInt64 ReturnTypeId() const;
    [[nodiscard]] std::string_view ReturnTypeName() const;
    [[nodiscard]] bool ReturnsVoid() const { return ReturnTypeId() == 0; }
    [[nodiscard]] Type DeclaringType() const;

    [[nodiscard]] Access GetAccess() const;
    [[nodiscard]] ModifierFlags GetModifiers() const;
    [[nodiscard]] bool IsStatic() const;
    [[nodiscard]] bool IsConst() const;
    [[nodiscard]] bool IsAccessible() const;
    void SetAccessible(bool flag) const;

    // Static methods ignore the receiver.
    [[nodiscard]] std::expected<Any, Error> Invoke(ObjectRef obj, const Any *args, NGIN::UIntSize count) const;
    [[nodiscard]] std::expected<Any, Error> Invoke(ObjectRef obj, std::span<const Any> args) const
    {
      return Invoke(obj, args.data(), static_cast<NGIN::UIntSize>(args.size()));
    }

    template <class R, class... A>
    [[nodiscard]] std::expected<R, Error> InvokeAs(ObjectRef obj, A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      auto r = Invoke(obj, tmp.data(), static_cast<NGIN::UIntSize>(tmp.size()));
      if (!r.has_value())
        return std::unexpected(std::move(r.error()));
      if constexpr (std::is_void_v<R>)
        return {};
      else
        return r->template Cast<R>();
    }

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeView AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;

    [[nodiscard]] bool operator==(const Method &other) const noexcept { return m_h == other.m_h; }

  private:
    MethodHandle m_h{};
  };

  class NGIN_MIRROR_API Constructor
  {
  public:
    constexpr Constructor() = default;
    explicit constexpr Constructor(ConstructorHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.ctorIndex < reg.types[m_h.typeIndex].constructors.Size();
    }
    [[nodiscard]] ConstructorHandle Handle() const noexcept { return m_h; }
    // The declaring type's qualified name.
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    [[nodiscard]] NGIN::UInt64 ParameterTypeId(NGIN::UIntSize i) const;
    [[nodiscard]] std::string_view ParameterTypeName(NGIN::UIntSize i) const;
    [[nodiscard]] Type DeclaringType() const;

    [[nodiscard]] Access GetAccess() const;
    [[nodiscard]] ModifierFlags GetModifiers() const;
    [[nodiscard]] bool IsAccessible() const;
    void SetAccessible(bool flag) const;

    [[nodiscard]] std::expected<Any, Error> Construct(const Any *args, NGIN::UIntSize count) const;
    [[nodiscard]] std::expected<Any, Error> Construct(std::span<const Any> args) const
    {
      return Construct(args.data(), static_cast<NGIN::UIntSize>(args.size()));
    }

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeView AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;

    [[nodiscard]] bool operator==(const Constructor &other) const noexcept { return m_h == other.m_h; }

  private:
    ConstructorHandle m_h{};
  };

  // A method or a constructor seen through the operations they share.
  class NGIN_MIRROR_API Executable
  {
  public:
    Executable() = default;
    Executable(Method m) : m_member(m) {}
    Executable(Constructor c) : m_member(c) {}

    [[nodiscard]] bool IsMethod() const noexcept { return std::holds_alternative<Method>(m_member); }
    [[nodiscard]] bool IsConstructor() const noexcept { return std::holds_alternative<Constructor>(m_member); }
    [[nodiscard]] std::optional<Method> AsMethod() const;
    [[nodiscard]] std::optional<Constructor> AsConstructor() const;

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    [[nodiscard]] NGIN::UInt64 ParameterTypeId(NGIN::UIntSize i) const;
    [[nodiscard]] std::string_view ParameterTypeName(NGIN::UIntSize i) const;
    [[nodiscard]] Type DeclaringType() const;
    [[nodiscard]] ModifierFlags GetModifiers() const;
    [[nodiscard]] bool IsAccessible() const;
    void SetAccessible(bool flag) const;

    // Constructors ignore the receiver.
    [[nodiscard]] std::expected<Any, Error> Invoke(ObjectRef obj, const Any *args, NGIN::UIntSize count) const;

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeView AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;

    [[nodiscard]] bool operator==(const Executable &other) const noexcept { return m_member == other.m_member; }

  private:
    std::variant<Method, Constructor> m_member{};
  };

  class NGIN_MIRROR_API Base
  {
  public:
    constexpr Base() = default;
    explicit constexpr Base(BaseHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.baseIndex < reg.types[m_h.typeIndex].bases.Size();
    }
    [[nodiscard]] Type BaseType() const;
    [[nodiscard]] void *Upcast(void *obj) const;
    [[nodiscard]] void *Downcast(void *obj) const;
    [[nodiscard]] bool CanDowncast() const;

  private:
    BaseHandle m_h{};
  };

  // Queries
  NGIN_MIRROR_API ExpectedType GetType(std::string_view name);
  NGIN_MIRROR_API std::optional<Type> FindType(std::string_view name);
  NGIN_MIRROR_API std::optional<Type> FindTypeById(NGIN::UInt64 typeId);

  template <class T>
  Type GetType()
  {
    return Type{TypeHandle{detail::EnsureRegistered<T>()}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    return FindTypeById(detail::TypeIdOf<T>());
  }

} // namespace NGIN::Mirror
