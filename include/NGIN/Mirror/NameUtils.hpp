// NameUtils.hpp
// Derives member identifiers from pointer constants using compiler signatures.
#pragma once

#include <string_view>

namespace NGIN::Mirror::detail {

consteval std::string_view TrimMemberSpelling(std::string_view full) noexcept {
  // GCC/Clang spell static members as "(& Class::member)" and data members as "&Class::member".
  while (!full.empty() && (full.front() == '&' || full.front() == '(' || full.front() == ' '))
    full.remove_prefix(1);
  while (!full.empty() && (full.back() == ')' || full.back() == ' '))
    full.remove_suffix(1);
  auto dc = full.rfind("::");
  if (dc == std::string_view::npos) return full;
  return full.substr(dc + 2);
}

template<auto MemberPtr>
consteval std::string_view MemberNameFromPretty() noexcept {
#if defined(_MSC_VER)
  constexpr std::string_view sig = __FUNCSIG__;
  // "... MemberNameFromPretty< &Class::member >(void) noexcept"
  constexpr std::string_view key = "MemberNameFromPretty<";
  auto kpos = sig.find(key);
  if (kpos == std::string_view::npos) return {};
  auto start = kpos + key.size();
  auto end = sig.find(">(", start);
  if (end == std::string_view::npos || end <= start) return {};
  return TrimMemberSpelling(sig.substr(start, end - start));
#elif defined(__clang__) || defined(__GNUC__)
  constexpr std::string_view sig = __PRETTY_FUNCTION__;
  // clang: "[MemberPtr = &Class::member]", gcc: "[with auto MemberPtr = &Class::member]"
  constexpr std::string_view key = "MemberPtr = ";
  auto kpos = sig.find(key);
  if (kpos == std::string_view::npos) return {};
  auto start = kpos + key.size();
  auto end = sig.find_first_of("];", start);
  if (end == std::string_view::npos || end <= start) return {};
  return TrimMemberSpelling(sig.substr(start, end - start));
#else
  return {};
#endif
}

} // namespace NGIN::Mirror::detail
