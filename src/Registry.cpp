#include <NGIN/Mirror/Registry.hpp>
#include <NGIN/Mirror/Log.hpp>

#include <string>

namespace NGIN::Mirror::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  void *UpcastTo(NGIN::UInt64 fromTypeId, void *obj, NGIN::UInt64 targetTypeId) noexcept
  {
    if (obj == nullptr)
      return nullptr;
    if (fromTypeId == targetTypeId)
      return obj;
    const auto &reg = GetRegistry();
    const auto *idx = reg.byTypeId.GetPtr(fromTypeId);
    if (!idx)
      return nullptr;
    const auto &bases = reg.types[*idx].bases;
    for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
    {
      if (!bases[i].Upcast)
        continue;
      if (auto *p = UpcastTo(bases[i].baseTypeId, bases[i].Upcast(obj), targetTypeId))
        return p;
    }
    return nullptr;
  }

} // namespace NGIN::Mirror::detail

namespace NGIN::Mirror
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsTypeAlive(NGIN::UInt32 index)
    {
      return index < GetRegistry().types.Size();
    }

    bool IsFieldAlive(FieldHandle h)
    {
      return h.IsValid() && IsTypeAlive(h.typeIndex) && h.fieldIndex < GetRegistry().types[h.typeIndex].fields.Size();
    }

    bool IsMethodAlive(MethodHandle h)
    {
      return h.IsValid() && IsTypeAlive(h.typeIndex) && h.methodIndex < GetRegistry().types[h.typeIndex].methods.Size();
    }

    bool IsCtorAlive(ConstructorHandle h)
    {
      return h.IsValid() && IsTypeAlive(h.typeIndex) && h.ctorIndex < GetRegistry().types[h.typeIndex].constructors.Size();
    }

    bool IsBaseAlive(BaseHandle h)
    {
      return h.IsValid() && IsTypeAlive(h.typeIndex) && h.baseIndex < GetRegistry().types[h.typeIndex].bases.Size();
    }

    const detail::FieldRuntimeDesc &FieldDesc(FieldHandle h)
    {
      return GetRegistry().types[h.typeIndex].fields[h.fieldIndex];
    }

    const detail::MethodRuntimeDesc &MethodDesc(MethodHandle h)
    {
      return GetRegistry().types[h.typeIndex].methods[h.methodIndex];
    }

    const detail::CtorRuntimeDesc &CtorDesc(ConstructorHandle h)
    {
      return GetRegistry().types[h.typeIndex].constructors[h.ctorIndex];
    }

    ModifierFlags AccessFlag(Access access)
    {
      switch (access)
      {
        case Access::Public: return ModifierFlags::Public;
        case Access::Protected: return ModifierFlags::Protected;
        case Access::Private: return ModifierFlags::Private;
      }
      return ModifierFlags::None;
    }

    ModifierFlags ComposeModifiers(Access access, bool isStatic, bool isConst)
    {
      auto flags = AccessFlag(access);
      if (isStatic)
        flags = flags | ModifierFlags::Static;
      if (isConst)
        flags = flags | ModifierFlags::Const;
      return flags;
    }

    std::expected<void, Error> CheckAccess(Access access, bool accessible, std::string_view what, std::string_view name)
    {
      if (access == Access::Public || accessible)
        return {};
      return std::unexpected(Error{ErrorCode::AccessDenied,
                                   std::string{what} + " '" + std::string{name} + "' is not accessible"});
    }

    // Adjusts the receiver to the declaring type of the member being accessed.
    std::expected<void *, Error> ResolveReceiver(ObjectRef obj, NGIN::UInt32 declaringIndex)
    {
      const auto &decl = GetRegistry().types[declaringIndex];
      if (obj.IsNull())
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "null receiver for instance member of " + std::string{decl.qualifiedName}});
      if (auto *p = detail::UpcastTo(obj.TypeId(), obj.Data(), decl.typeId))
        return p;
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   "receiver is not an instance of " + std::string{decl.qualifiedName}});
    }

    std::expected<AttributeView, Error> FindAttribute(const NGIN::Containers::Vector<AttributeDesc> &v, std::string_view key)
    {
      for (NGIN::UIntSize i = 0; i < v.Size(); ++i)
        if (v[i].key == key)
          return AttributeView{v[i].key, &v[i].value};
      return std::unexpected(Error{ErrorCode::NotFound, "attribute not found"});
    }

    bool IsDerivedFromIndex(NGIN::UInt32 index, NGIN::UInt64 baseTypeId)
    {
      const auto &bases = GetRegistry().types[index].bases;
      for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
      {
        if (bases[i].baseTypeId == baseTypeId || IsDerivedFromIndex(bases[i].baseTypeIndex, baseTypeId))
          return true;
      }
      return false;
    }
  } // namespace

  std::string ModifiersToString(ModifierFlags flags)
  {
    std::string out;
    auto append = [&](ModifierFlags flag, std::string_view word)
    {
      if (!HasFlag(flags, flag))
        return;
      if (!out.empty())
        out += ' ';
      out += word;
    };
    append(ModifierFlags::Public, "public");
    append(ModifierFlags::Protected, "protected");
    append(ModifierFlags::Private, "private");
    append(ModifierFlags::Static, "static");
    append(ModifierFlags::Const, "const");
    return out;
  }

  // Type
  std::string_view Type::QualifiedName() const
  {
    if (!IsValid())
      return {};
    return GetRegistry().types[m_h.index].qualifiedName;
  }

  NGIN::UInt64 Type::GetTypeId() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].typeId;
  }

  NGIN::UIntSize Type::Size() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].sizeBytes;
  }

  NGIN::UIntSize Type::Alignment() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].alignBytes;
  }

  NGIN::UIntSize Type::FieldCount() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].fields.Size();
  }

  Field Type::FieldAt(NGIN::UIntSize i) const
  {
    if (i >= FieldCount())
      return Field{};
    return Field{FieldHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedField Type::GetField(std::string_view name) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    if (auto f = FindField(name))
      return *f;
    return std::unexpected(Error{ErrorCode::NotFound, "field not found: " + std::string{name}});
  }

  std::optional<Field> Type::FindField(std::string_view name) const
  {
    if (!IsValid())
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = tdesc.fieldIndex.GetPtr(nid))
        return Field{FieldHandle{m_h.index, *p}};
    }
    return std::nullopt;
  }

  NGIN::UIntSize Type::MethodCount() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].methods.Size();
  }

  Method Type::MethodAt(NGIN::UIntSize i) const
  {
    if (i >= MethodCount())
      return Method{};
    return Method{MethodHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedMethod Type::GetMethod(std::string_view name) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    auto overloads = FindMethods(name);
    if (overloads.Size() == 0)
      return std::unexpected(Error{ErrorCode::NotFound, "method not found: " + std::string{name}});
    return overloads[0];
  }

  NGIN::Containers::Vector<Method> Type::FindMethods(std::string_view name) const
  {
    NGIN::Containers::Vector<Method> out;
    if (!IsValid())
      return out;
    const auto &tdesc = GetRegistry().types[m_h.index];
    NameId nid{};
    if (!detail::FindNameId(name, nid))
      return out;
    if (auto *vec = tdesc.methodOverloads.GetPtr(nid))
    {
      out.Reserve(vec->Size());
      for (NGIN::UIntSize i = 0; i < vec->Size(); ++i)
        out.PushBack(Method{MethodHandle{m_h.index, (*vec)[i]}});
    }
    return out;
  }

  NGIN::UIntSize Type::ConstructorCount() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].constructors.Size();
  }

  Constructor Type::ConstructorAt(NGIN::UIntSize i) const
  {
    if (i >= ConstructorCount())
      return Constructor{};
    return Constructor{ConstructorHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  NGIN::UIntSize Type::AttributeCount() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].attributes.Size();
  }

  AttributeView Type::AttributeAt(NGIN::UIntSize i) const
  {
    if (i >= AttributeCount())
      return AttributeView{};
    const auto &a = GetRegistry().types[m_h.index].attributes[i];
    return AttributeView{a.key, &a.value};
  }

  std::expected<AttributeView, Error> Type::Attribute(std::string_view key) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    return FindAttribute(GetRegistry().types[m_h.index].attributes, key);
  }

  NGIN::UIntSize Type::BaseCount() const
  {
    if (!IsValid())
      return 0;
    return GetRegistry().types[m_h.index].bases.Size();
  }

  Base Type::BaseAt(NGIN::UIntSize i) const
  {
    if (i >= BaseCount())
      return Base{};
    return Base{BaseHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedBase Type::GetBase(const Type &base) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    if (auto b = FindBase(base))
      return *b;
    return std::unexpected(Error{ErrorCode::NotFound, "base type not found"});
  }

  std::optional<Base> Type::FindBase(const Type &base) const
  {
    if (!IsValid())
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (auto *p = tdesc.baseIndex.GetPtr(base.GetTypeId()))
      return Base{BaseHandle{m_h.index, *p}};
    return std::nullopt;
  }

  bool Type::IsDerivedFrom(const Type &base) const
  {
    if (!IsValid() || !base.IsValid())
      return false;
    return IsDerivedFromIndex(m_h.index, base.GetTypeId());
  }

  // Field
  std::string_view Field::Name() const
  {
    if (!IsFieldAlive(m_h))
      return {};
    return FieldDesc(m_h).name;
  }

  NGIN::UInt64 Field::TypeId() const
  {
    if (!IsFieldAlive(m_h))
      return 0;
    return FieldDesc(m_h).typeId;
  }

  std::string_view Field::TypeName() const
  {
    if (!IsFieldAlive(m_h))
      return {};
    return FieldDesc(m_h).typeName;
  }

  Type Field::DeclaringType() const
  {
    if (!IsFieldAlive(m_h))
      return Type{};
    return Type{TypeHandle{m_h.typeIndex}};
  }

  Access Field::GetAccess() const
  {
    if (!IsFieldAlive(m_h))
      return Access::Public;
    return FieldDesc(m_h).access;
  }

  ModifierFlags Field::GetModifiers() const
  {
    if (!IsFieldAlive(m_h))
      return ModifierFlags::None;
    const auto &f = FieldDesc(m_h);
    return ComposeModifiers(f.access, f.isStatic, f.isConst);
  }

  bool Field::IsStatic() const { return IsFieldAlive(m_h) && FieldDesc(m_h).isStatic; }
  bool Field::IsConst() const { return IsFieldAlive(m_h) && FieldDesc(m_h).isConst; }
  bool Field::IsAccessible() const { return IsFieldAlive(m_h) && FieldDesc(m_h).accessible; }

  void Field::SetAccessible(bool flag) const
  {
    if (!IsFieldAlive(m_h))
      return;
    GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].accessible = flag;
  }

  std::expected<Any, Error> Field::GetValue(ObjectRef obj) const
  {
    if (!IsFieldAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &f = FieldDesc(m_h);
    if (auto ok = CheckAccess(f.access, f.accessible, "field", f.name); !ok)
      return std::unexpected(std::move(ok.error()));
    if (f.isStatic)
      return f.Load(nullptr);
    auto self = ResolveReceiver(obj, m_h.typeIndex);
    if (!self)
      return std::unexpected(std::move(self.error()));
    return f.Load(*self);
  }

  std::expected<void, Error> Field::SetValue(ObjectRef obj, const Any &value) const
  {
    if (!IsFieldAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &f = FieldDesc(m_h);
    if (auto ok = CheckAccess(f.access, f.accessible, "field", f.name); !ok)
      return std::unexpected(std::move(ok.error()));
    if (f.isConst)
      return std::unexpected(Error{ErrorCode::AccessDenied, "field '" + std::string{f.name} + "' is read-only"});
    if (f.isStatic)
      return f.Store(nullptr, value);
    if (obj.IsConst())
      return std::unexpected(Error{ErrorCode::AccessDenied, "field '" + std::string{f.name} + "' cannot be set on a const receiver"});
    auto self = ResolveReceiver(obj, m_h.typeIndex);
    if (!self)
      return std::unexpected(std::move(self.error()));
    return f.Store(*self, value);
  }

  NGIN::UIntSize Field::AttributeCount() const
  {
    if (!IsFieldAlive(m_h))
      return 0;
    return FieldDesc(m_h).attributes.Size();
  }

  AttributeView Field::AttributeAt(NGIN::UIntSize i) const
  {
    if (i >= AttributeCount())
      return AttributeView{};
    const auto &a = FieldDesc(m_h).attributes[i];
    return AttributeView{a.key, &a.value};
  }

  std::expected<AttributeView, Error> Field::Attribute(std::string_view key) const
  {
    if (!IsFieldAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    return FindAttribute(FieldDesc(m_h).attributes, key);
  }

  // Method
  std::string_view Method::Name() const
  {
    if (!IsMethodAlive(m_h))
      return {};
    return MethodDesc(m_h).name;
  }

  NGIN::UIntSize Method::ParameterCount() const
  {
    if (!IsMethodAlive(m_h))
      return 0;
    return MethodDesc(m_h).paramTypeIds.Size();
  }

  NGIN::UInt64 Method::ParameterTypeId(NGIN::UIntSize i) const
  {
    if (i >= ParameterCount())
      return 0;
    return MethodDesc(m_h).paramTypeIds[i];
  }

  std::string_view Method::ParameterTypeName(NGIN::UIntSize i) const
  {
    if (i >= ParameterCount())
      return {};
    return MethodDesc(m_h).paramTypeNames[i];
  }

  NGIN::UInt64 Method::ReturnTypeId() const
  {
    if (!IsMethodAlive(m_h))
      return 0;
    return MethodDesc(m_h).returnTypeId;
  }

  std::string_view Method::ReturnTypeName() const
  {
    if (!IsMethodAlive(m_h))
      return {};
    return MethodDesc(m_h).returnTypeName;
  }

  Type Method::DeclaringType() const
  {
    if (!IsMethodAlive(m_h))
      return Type{};
    return Type{TypeHandle{m_h.typeIndex}};
  }

  Access Method::GetAccess() const
  {
    if (!IsMethodAlive(m_h))
      return Access::Public;
    return MethodDesc(m_h).access;
  }

  ModifierFlags Method::GetModifiers() const
  {
    if (!IsMethodAlive(m_h))
      return ModifierFlags::None;
    const auto &m = MethodDesc(m_h);
    return ComposeModifiers(m.access, m.isStatic, m.isConst);
  }

  bool Method::IsStatic() const { return IsMethodAlive(m_h) && MethodDesc(m_h).isStatic; }
  bool Method::IsConst() const { return IsMethodAlive(m_h) && MethodDesc(m_h).isConst; }
  bool Method::IsAccessible() const { return IsMethodAlive(m_h) && MethodDesc(m_h).accessible; }

  void Method::SetAccessible(bool flag) const
  {
    if (!IsMethodAlive(m_h))
      return;
    GetRegistry().types[m_h.typeIndex].methods[m_h.methodIndex].accessible = flag;
  }

  std::expected<Any, Error> Method::Invoke(ObjectRef obj, const Any *args, NGIN::UIntSize count) const
  {
    if (!IsMethodAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &m = MethodDesc(m_h);
    if (auto ok = CheckAccess(m.access, m.accessible, "method", m.name); !ok)
      return std::unexpected(std::move(ok.error()));
    if (count != m.paramTypeIds.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
    if (m.isStatic)
      return m.Invoke(nullptr, args, count);
    if (obj.IsConst() && !m.isConst)
      return std::unexpected(Error{ErrorCode::AccessDenied, "method '" + std::string{m.name} + "' is not const"});
    auto self = ResolveReceiver(obj, m_h.typeIndex);
    if (!self)
      return std::unexpected(std::move(self.error()));
    return m.Invoke(*self, args, count);
  }

  NGIN::UIntSize Method::AttributeCount() const
  {
    if (!IsMethodAlive(m_h))
      return 0;
    return MethodDesc(m_h).attributes.Size();
  }

  AttributeView Method::AttributeAt(NGIN::UIntSize i) const
  {
    if (i >= AttributeCount())
      return AttributeView{};
    const auto &a = MethodDesc(m_h).attributes[i];
    return AttributeView{a.key, &a.value};
  }

  std::expected<AttributeView, Error> Method::Attribute(std::string_view key) const
  {
    if (!IsMethodAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    return FindAttribute(MethodDesc(m_h).attributes, key);
  }

  // Constructor
  std::string_view Constructor::Name() const
  {
    if (!IsCtorAlive(m_h))
      return {};
    return GetRegistry().types[m_h.typeIndex].qualifiedName;
  }

  NGIN::UIntSize Constructor::ParameterCount() const
  {
    if (!IsCtorAlive(m_h))
      return 0;
    return CtorDesc(m_h).paramTypeIds.Size();
  }

  NGIN::UInt64 Constructor::ParameterTypeId(NGIN::UIntSize i) const
  {
    if (i >= ParameterCount())
      return 0;
    return CtorDesc(m_h).paramTypeIds[i];
  }

  std::string_view Constructor::ParameterTypeName(NGIN::UIntSize i) const
  {
    if (i >= ParameterCount())
      return {};
    return CtorDesc(m_h).paramTypeNames[i];
  }

  Type Constructor::DeclaringType() const
  {
    if (!IsCtorAlive(m_h))
      return Type{};
    return Type{TypeHandle{m_h.typeIndex}};
  }

  Access Constructor::GetAccess() const
  {
    if (!IsCtorAlive(m_h))
      return Access::Public;
    return CtorDesc(m_h).access;
  }

  ModifierFlags Constructor::GetModifiers() const
  {
    if (!IsCtorAlive(m_h))
      return ModifierFlags::None;
    return ComposeModifiers(CtorDesc(m_h).access, false, false);
  }

  bool Constructor::IsAccessible() const { return IsCtorAlive(m_h) && CtorDesc(m_h).accessible; }

  void Constructor::SetAccessible(bool flag) const
  {
    if (!IsCtorAlive(m_h))
      return;
    GetRegistry().types[m_h.typeIndex].constructors[m_h.ctorIndex].accessible = flag;
  }

  std::expected<Any, Error> Constructor::Construct(const Any *args, NGIN::UIntSize count) const
  {
    if (!IsCtorAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &c = CtorDesc(m_h);
    if (auto ok = CheckAccess(c.access, c.accessible, "constructor", Name()); !ok)
      return std::unexpected(std::move(ok.error()));
    return c.Construct(args, count);
  }

  NGIN::UIntSize Constructor::AttributeCount() const
  {
    if (!IsCtorAlive(m_h))
      return 0;
    return CtorDesc(m_h).attributes.Size();
  }

  AttributeView Constructor::AttributeAt(NGIN::UIntSize i) const
  {
    if (i >= AttributeCount())
      return AttributeView{};
    const auto &a = CtorDesc(m_h).attributes[i];
    return AttributeView{a.key, &a.value};
  }

  std::expected<AttributeView, Error> Constructor::Attribute(std::string_view key) const
  {
    if (!IsCtorAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    return FindAttribute(CtorDesc(m_h).attributes, key);
  }

  // Executable
  std::optional<Method> Executable::AsMethod() const
  {
    if (auto *m = std::get_if<Method>(&m_member))
      return *m;
    return std::nullopt;
  }

  std::optional<Constructor> Executable::AsConstructor() const
  {
    if (auto *c = std::get_if<Constructor>(&m_member))
      return *c;
    return std::nullopt;
  }

  bool Executable::IsValid() const noexcept
  {
    return std::visit([](const auto &e) { return e.IsValid(); }, m_member);
  }

  std::string_view Executable::Name() const
  {
    return std::visit([](const auto &e) { return e.Name(); }, m_member);
  }

  NGIN::UIntSize Executable::ParameterCount() const
  {
    return std::visit([](const auto &e) { return e.ParameterCount(); }, m_member);
  }

  NGIN::UInt64 Executable::ParameterTypeId(NGIN::UIntSize i) const
  {
    return std::visit([i](const auto &e) { return e.ParameterTypeId(i); }, m_member);
  }

  std::string_view Executable::ParameterTypeName(NGIN::UIntSize i) const
  {
    return std::visit([i](const auto &e) { return e.ParameterTypeName(i); }, m_member);
  }

  Type Executable::DeclaringType() const
  {
    return std::visit([](const auto &e) { return e.DeclaringType(); }, m_member);
  }

  ModifierFlags Executable::GetModifiers() const
  {
    return std::visit([](const auto &e) { return e.GetModifiers(); }, m_member);
  }

  bool Executable::IsAccessible() const
  {
    return std::visit([](const auto &e) { return e.IsAccessible(); }, m_member);
  }

  void Executable::SetAccessible(bool flag) const
  {
    std::visit([flag](const auto &e) { e.SetAccessible(flag); }, m_member);
  }

  std::expected<Any, Error> Executable::Invoke(ObjectRef obj, const Any *args, NGIN::UIntSize count) const
  {
    if (auto *m = std::get_if<Method>(&m_member))
      return m->Invoke(obj, args, count);
    return std::get<Constructor>(m_member).Construct(args, count);
  }

  NGIN::UIntSize Executable::AttributeCount() const
  {
    return std::visit([](const auto &e) { return e.AttributeCount(); }, m_member);
  }

  AttributeView Executable::AttributeAt(NGIN::UIntSize i) const
  {
    return std::visit([i](const auto &e) { return e.AttributeAt(i); }, m_member);
  }

  std::expected<AttributeView, Error> Executable::Attribute(std::string_view key) const
  {
    return std::visit([key](const auto &e) { return e.Attribute(key); }, m_member);
  }

  // Base
  Type Base::BaseType() const
  {
    if (!IsBaseAlive(m_h))
      return Type{};
    return Type{TypeHandle{GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex].baseTypeIndex}};
  }

  void *Base::Upcast(void *obj) const
  {
    if (!IsBaseAlive(m_h))
      return nullptr;
    const auto &b = GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex];
    return b.Upcast ? b.Upcast(obj) : nullptr;
  }

  void *Base::Downcast(void *obj) const
  {
    if (!IsBaseAlive(m_h))
      return nullptr;
    const auto &b = GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex];
    return b.Downcast ? b.Downcast(obj) : nullptr;
  }

  bool Base::CanDowncast() const
  {
    return IsBaseAlive(m_h) && GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex].Downcast != nullptr;
  }

  // Queries
  ExpectedType GetType(std::string_view name)
  {
    if (auto t = FindType(name))
      return *t;
    NGIN_MIRROR_DEBUG("type lookup failed for '{}'", name);
    return std::unexpected(Error{ErrorCode::NotFound, "type not found: " + std::string{name}});
  }

  std::optional<Type> FindType(std::string_view name)
  {
    const auto &reg = GetRegistry();
    NameId nid{};
    if (!detail::FindNameId(name, nid))
      return std::nullopt;
    if (auto *p = reg.byName.GetPtr(nid))
      return Type{TypeHandle{*p}};
    return std::nullopt;
  }

  std::optional<Type> FindTypeById(NGIN::UInt64 typeId)
  {
    const auto &reg = GetRegistry();
    if (auto *p = reg.byTypeId.GetPtr(typeId))
      return Type{TypeHandle{*p}};
    return std::nullopt;
  }

} // namespace NGIN::Mirror
