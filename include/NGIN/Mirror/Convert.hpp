// Convert.hpp — Any -> T argument conversion shared by fields, methods and constructors
#pragma once

#include <NGIN/Primitives.hpp>

#include <expected>
#include <string>
#include <type_traits>

#include <NGIN/Mirror/Registry.hpp>
#include <NGIN/Mirror/Types.hpp>

namespace NGIN::Mirror::detail
{

  template <class T>
  inline constexpr bool IsNumericV = std::is_arithmetic_v<std::remove_cvref_t<T>>;

  template <class From, class Dest>
  inline bool TryNumeric(const Any &src, Dest &out)
  {
    if (src.GetTypeId() != TypeIdOf<From>())
      return false;
    out = static_cast<Dest>(src.template Cast<From>());
    return true;
  }

  // Exact match first, then arithmetic conversions between the built-in numeric types.
  template <class To>
  inline std::expected<std::remove_cvref_t<To>, Error> ConvertAny(const Any &src)
  {
    using Dest = std::remove_cvref_t<To>;
    if (src.GetTypeId() == TypeIdOf<Dest>())
      return src.template Cast<Dest>();
    if constexpr (IsNumericV<Dest>)
    {
      Dest out{};
      if (TryNumeric<bool>(src, out) || TryNumeric<signed char>(src, out) || TryNumeric<unsigned char>(src, out) ||
          TryNumeric<char>(src, out) || TryNumeric<short>(src, out) || TryNumeric<unsigned short>(src, out) ||
          TryNumeric<int>(src, out) || TryNumeric<unsigned int>(src, out) || TryNumeric<long>(src, out) ||
          TryNumeric<unsigned long>(src, out) || TryNumeric<long long>(src, out) ||
          TryNumeric<unsigned long long>(src, out) || TryNumeric<float>(src, out) || TryNumeric<double>(src, out) ||
          TryNumeric<long double>(src, out))
        return out;
    }
    return std::unexpected(Error{ErrorCode::IncompatibleArgument,
                                 std::string{"argument not convertible to "} + std::string{TypeNameOf<Dest>()}});
  }

} // namespace NGIN::Mirror::detail
