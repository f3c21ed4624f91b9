#include <NGIN/Mirror/MemberWrap.hpp>
#include <NGIN/Mirror/Log.hpp>

namespace NGIN::Mirror
{
  namespace
  {
    constexpr std::string_view kNullName = "null";

    template <class W>
    std::variant<std::monostate, Field, Method, Constructor> Hold(const W &member)
    {
      if (!member.IsValid())
        return std::monostate{};
      return member;
    }

    NGIN::UInt64 ComposeHash(MemberKind kind, NGIN::UInt32 typeIndex, NGIN::UInt32 memberIndex) noexcept
    {
      return ((static_cast<NGIN::UInt64>(kind) + 1) << 56) |
             ((static_cast<NGIN::UInt64>(typeIndex) & 0xFFFFFFFFull) << 24) |
             (static_cast<NGIN::UInt64>(memberIndex) & 0xFFFFFFull);
    }

    std::string ReceiverTypeName(ObjectRef obj)
    {
      if (obj.IsNull())
        return "null";
      if (auto t = FindTypeById(obj.TypeId()))
        return std::string{t->QualifiedName()};
      return "unknown type";
    }

    template <class Exec>
    void AppendParameterList(std::string &out, const Exec &exec)
    {
      out += '(';
      for (NGIN::UIntSize i = 0; i < exec.ParameterCount(); ++i)
      {
        if (i != 0)
          out += ", ";
        out += exec.ParameterTypeName(i);
      }
      out += ')';
    }

    std::string Render(ModifierFlags flags, std::string_view name)
    {
      std::string out = ModifiersToString(flags);
      if (!out.empty())
        out += ' ';
      out += name;
      return out;
    }

    // Calls `ctor` with no argument or with the receiver as its single argument.
    std::expected<Any, Error> ConstructFrom(const MemberWrap &wrap, const Constructor &ctor, ObjectRef obj)
    {
      const auto count = ctor.ParameterCount();
      if (count == 0)
        return ctor.Construct(nullptr, 0);

      void *adjusted = nullptr;
      if (count == 1 && !obj.IsNull())
        adjusted = detail::UpcastTo(obj.TypeId(), obj.Data(), ctor.ParameterTypeId(0));
      if (adjusted == nullptr)
      {
        std::string msg = "Constructor<";
        msg += wrap.Signature();
        msg += "> is expected to have one parameter that can take ";
        msg += ReceiverTypeName(obj);
        msg += " or no parameters.";
        return std::unexpected(Error{ErrorCode::IncompatibleArgument, std::move(msg)});
      }

      Any arg = Any::MakeVoid();
      if (obj.TypeId() == ctor.ParameterTypeId(0))
      {
        arg = obj.Box();
      }
      else
      {
        const auto &reg = detail::GetRegistry();
        if (const auto *idx = reg.byTypeId.GetPtr(ctor.ParameterTypeId(0)))
        {
          if (const auto box = reg.types[*idx].Box)
            arg = box(adjusted);
        }
      }
      if (!arg.HasValue())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "parameter type is not copyable"});
      return ctor.Construct(&arg, 1);
    }
  } // namespace

  MemberWrap::MemberWrap(const Field &field) : m_member(Hold(field)) {}
  MemberWrap::MemberWrap(const Method &method) : m_member(Hold(method)) {}
  MemberWrap::MemberWrap(const Constructor &constructor) : m_member(Hold(constructor)) {}

  MemberWrap::MemberWrap(const Executable &executable)
  {
    if (auto m = executable.AsMethod())
      m_member = Hold(*m);
    else if (auto c = executable.AsConstructor())
      m_member = Hold(*c);
  }

  MemberWrap::MemberWrap(const std::optional<Field> &field)
  {
    if (field)
      m_member = Hold(*field);
  }

  MemberWrap::MemberWrap(const std::optional<Method> &method)
  {
    if (method)
      m_member = Hold(*method);
  }

  MemberWrap::MemberWrap(const std::optional<Constructor> &constructor)
  {
    if (constructor)
      m_member = Hold(*constructor);
  }

  MemberWrap MemberWrap::FirstOf(std::initializer_list<MemberWrap> candidates)
  {
    for (const auto &candidate : candidates)
      if (!candidate.IsEmpty())
        return candidate;
    return MemberWrap{};
  }

  MemberWrap MemberWrap::Find(const Type &type, std::string_view name)
  {
    auto found = FirstOf({MemberWrap{FindGetterMethod(type, name)},
                          MemberWrap{FindField(type, name)}});
    NGIN_MIRROR_TRACE("Find({}, {}) -> {}", type.QualifiedName(), name, found.Name());
    return found;
  }

  MemberWrap MemberWrap::Find(const Type &type, std::string_view name, const Type &valueType)
  {
    if (!type.IsValid())
      return MemberWrap{};
    auto found = FirstOf({MemberWrap{FindSetterMethod(type, name, valueType.GetTypeId())},
                          MemberWrap{FindField(type, name)},
                          MemberWrap{FindGetterMethod(type, name)},
                          MemberWrap{FindConstructor(valueType, type.GetTypeId())}});
    NGIN_MIRROR_TRACE("Find({}, {}, {}) -> {}", type.QualifiedName(), name, valueType.QualifiedName(), found.Name());
    return found;
  }

  MemberWrap MemberWrap::ForConstructor(const Type &paramType, const Type &constructedType)
  {
    return MemberWrap{FindConstructor(constructedType, paramType.GetTypeId())};
  }

  NGIN::Containers::Vector<MemberWrap> MemberWrap::Fields(const Type &type)
  {
    NGIN::Containers::Vector<MemberWrap> out;
    const auto fields = detail::VisibleFields(type);
    out.Reserve(fields.Size());
    for (NGIN::UIntSize i = 0; i < fields.Size(); ++i)
      out.PushBack(MemberWrap{fields[i]});
    return out;
  }

  NGIN::Containers::Vector<MemberWrap> MemberWrap::Methods(const Type &type)
  {
    NGIN::Containers::Vector<MemberWrap> out;
    const auto methods = detail::VisibleMethods(type);
    out.Reserve(methods.Size());
    for (NGIN::UIntSize i = 0; i < methods.Size(); ++i)
      out.PushBack(MemberWrap{methods[i]});
    return out;
  }

  NGIN::Containers::Vector<MemberWrap> MemberWrap::Members(const Type &type)
  {
    auto out = Fields(type);
    const auto methods = Methods(type);
    out.Reserve(out.Size() + methods.Size());
    for (NGIN::UIntSize i = 0; i < methods.Size(); ++i)
      out.PushBack(methods[i]);
    return out;
  }

  std::optional<MemberKind> MemberWrap::Kind() const noexcept
  {
    return Visit([](const Field &) -> std::optional<MemberKind> { return MemberKind::Field; },
                 [](const Method &) -> std::optional<MemberKind> { return MemberKind::Method; },
                 [](const Constructor &) -> std::optional<MemberKind> { return MemberKind::Constructor; },
                 []() -> std::optional<MemberKind> { return std::nullopt; });
  }

  std::optional<Field> MemberWrap::AsField() const
  {
    return Visit([](const Field &f) -> std::optional<Field> { return f; },
                 [](const Method &) -> std::optional<Field> { return std::nullopt; },
                 [](const Constructor &) -> std::optional<Field> { return std::nullopt; },
                 []() -> std::optional<Field> { return std::nullopt; });
  }

  std::optional<Method> MemberWrap::AsMethod() const
  {
    return Visit([](const Field &) -> std::optional<Method> { return std::nullopt; },
                 [](const Method &m) -> std::optional<Method> { return m; },
                 [](const Constructor &) -> std::optional<Method> { return std::nullopt; },
                 []() -> std::optional<Method> { return std::nullopt; });
  }

  std::optional<Constructor> MemberWrap::AsConstructor() const
  {
    return Visit([](const Field &) -> std::optional<Constructor> { return std::nullopt; },
                 [](const Method &) -> std::optional<Constructor> { return std::nullopt; },
                 [](const Constructor &c) -> std::optional<Constructor> { return c; },
                 []() -> std::optional<Constructor> { return std::nullopt; });
  }

  std::optional<Executable> MemberWrap::AsExecutable() const
  {
    return VisitExecutable([](const Executable &e) -> std::optional<Executable> { return e; },
                           []() -> std::optional<Executable> { return std::nullopt; });
  }

  bool MemberWrap::IsSettable(const AccessorConvention &convention) const
  {
    return Visit([](const Field &) { return true; },
                 [&convention](const Method &m) { return IsSetterMethod(m, convention); },
                 [](const Constructor &) { return false; },
                 []() { return false; });
  }

  bool MemberWrap::IsGettable() const
  {
    return Visit([](const Field &) { return true; },
                 [](const Method &m) { return IsGetterMethod(m); },
                 [](const Constructor &) { return true; },
                 []() { return false; });
  }

  std::expected<Any, Error> MemberWrap::GetChecked(ObjectRef obj) const
  {
    using Result = std::expected<Any, Error>;
    return Visit([&obj](const Field &f) -> Result { return f.GetValue(obj); },
                 [&obj](const Method &m) -> Result
                 {
                   if (m.ParameterCount() != 0)
                     return std::unexpected(Error{ErrorCode::InvalidArgument,
                                                  "method '" + std::string{m.Name()} + "' takes parameters"});
                   return m.Invoke(obj, nullptr, 0);
                 },
                 [this, &obj](const Constructor &c) -> Result { return ConstructFrom(*this, c, obj); },
                 []() -> Result { return Any::MakeVoid(); });
  }

  Any MemberWrap::Get(ObjectRef obj) const
  {
    auto result = GetChecked(obj);
    if (!result)
    {
      NGIN_MIRROR_DEBUG("Get on {} failed: {}", Signature(), result.error().message);
      return Any::MakeVoid();
    }
    return std::move(*result);
  }

  std::expected<bool, Error> MemberWrap::SetChecked(ObjectRef obj, const Any &value) const
  {
    using Result = std::expected<bool, Error>;
    return Visit([&](const Field &f) -> Result
                 {
                   auto stored = f.SetValue(obj, value);
                   if (!stored)
                     return std::unexpected(std::move(stored.error()));
                   return true;
                 },
                 [&](const Method &m) -> Result
                 {
                   auto called = m.Invoke(obj, &value, 1);
                   if (!called)
                     return std::unexpected(std::move(called.error()));
                   return true;
                 },
                 [](const Constructor &) -> Result { return false; },
                 []() -> Result { return false; });
  }

  bool MemberWrap::Set(ObjectRef obj, const Any &value) const
  {
    auto result = SetChecked(obj, value);
    if (!result)
    {
      NGIN_MIRROR_DEBUG("Set on {} failed: {}", Signature(), result.error().message);
      return false;
    }
    return *result;
  }

  std::string_view MemberWrap::Name() const
  {
    return VisitMember([](const auto &member) { return member.Name(); },
                       []() { return kNullName; });
  }

  ModifierFlags MemberWrap::GetModifiers() const
  {
    return VisitMember([](const auto &member) { return member.GetModifiers(); },
                       []() { return ModifierFlags::None; });
  }

  Type MemberWrap::DeclaringType() const
  {
    return VisitMember([](const auto &member) { return member.DeclaringType(); },
                       []() { return Type{}; });
  }

  int MemberWrap::ParameterCount() const
  {
    return VisitExecutable([](const Executable &e) { return static_cast<int>(e.ParameterCount()); },
                           []() { return -1; });
  }

  NGIN::Containers::Vector<NGIN::UInt64> MemberWrap::ParameterTypeIds() const
  {
    NGIN::Containers::Vector<NGIN::UInt64> out;
    VisitExecutable([&out](const Executable &e)
                    {
                      for (NGIN::UIntSize i = 0; i < e.ParameterCount(); ++i)
                        out.PushBack(e.ParameterTypeId(i));
                    },
                    []() {});
    return out;
  }

  NGIN::Containers::Vector<std::string_view> MemberWrap::ParameterTypeNames() const
  {
    NGIN::Containers::Vector<std::string_view> out;
    VisitExecutable([&out](const Executable &e)
                    {
                      for (NGIN::UIntSize i = 0; i < e.ParameterCount(); ++i)
                        out.PushBack(e.ParameterTypeName(i));
                    },
                    []() {});
    return out;
  }

  NGIN::UInt64 MemberWrap::ReturnTypeId() const
  {
    return Visit([](const Field &f) { return f.TypeId(); },
                 [](const Method &m) { return m.ReturnTypeId(); },
                 [](const Constructor &c) { return c.DeclaringType().GetTypeId(); },
                 []() { return NGIN::UInt64{0}; });
  }

  NGIN::UIntSize MemberWrap::AttributeCount() const
  {
    return VisitMember([](const auto &member) { return member.AttributeCount(); },
                       []() { return NGIN::UIntSize{0}; });
  }

  AttributeView MemberWrap::AttributeAt(NGIN::UIntSize i) const
  {
    return VisitMember([i](const auto &member) { return member.AttributeAt(i); },
                       []() { return AttributeView{}; });
  }

  std::expected<AttributeView, Error> MemberWrap::Attribute(std::string_view key) const
  {
    using Result = std::expected<AttributeView, Error>;
    return VisitMember([key](const auto &member) -> Result { return member.Attribute(key); },
                       []() -> Result { return std::unexpected(Error{ErrorCode::NotFound, "empty member"}); });
  }

  bool MemberWrap::IsAccessible() const
  {
    return VisitMember([](const auto &member) { return member.IsAccessible(); },
                       []() { return false; });
  }

  void MemberWrap::SetAccessible(bool flag) const
  {
    VisitMember([flag](const auto &member) { member.SetAccessible(flag); },
                []() {});
  }

  std::string MemberWrap::Signature() const
  {
    return Visit([](const Field &f) { return Render(f.GetModifiers(), f.Name()); },
                 [](const Method &m)
                 {
                   auto out = Render(m.GetModifiers() & ~ModifierFlags::Const, m.Name());
                   AppendParameterList(out, m);
                   if (m.IsConst())
                     out += " const";
                   return out;
                 },
                 [](const Constructor &c)
                 {
                   auto out = Render(c.GetModifiers(), c.Name());
                   AppendParameterList(out, c);
                   return out;
                 },
                 []() { return std::string{kNullName}; });
  }

  NGIN::UInt64 MemberWrap::Hash() const noexcept
  {
    return Visit([](const Field &f) { return ComposeHash(MemberKind::Field, f.Handle().typeIndex, f.Handle().fieldIndex); },
                 [](const Method &m) { return ComposeHash(MemberKind::Method, m.Handle().typeIndex, m.Handle().methodIndex); },
                 [](const Constructor &c) { return ComposeHash(MemberKind::Constructor, c.Handle().typeIndex, c.Handle().ctorIndex); },
                 []() { return NGIN::UInt64{0}; });
  }

  bool MemberWrap::operator==(const Field &field) const noexcept
  {
    auto *held = std::get_if<Field>(&m_member);
    return held != nullptr && *held == field;
  }

  bool MemberWrap::operator==(const Method &method) const noexcept
  {
    auto *held = std::get_if<Method>(&m_member);
    return held != nullptr && *held == method;
  }

  bool MemberWrap::operator==(const Constructor &constructor) const noexcept
  {
    auto *held = std::get_if<Constructor>(&m_member);
    return held != nullptr && *held == constructor;
  }

} // namespace NGIN::Mirror
