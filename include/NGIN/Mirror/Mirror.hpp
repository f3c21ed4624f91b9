#pragma once

#include <string_view>

#include <NGIN/Mirror/Export.hpp>
#include <NGIN/Mirror/Types.hpp>
#include <NGIN/Mirror/Registry.hpp>
#include <NGIN/Mirror/NameUtils.hpp>
#include <NGIN/Mirror/TypeBuilder.hpp>
#include <NGIN/Mirror/Resolver.hpp>
#include <NGIN/Mirror/MemberWrap.hpp>
#include <NGIN/Mirror/Log.hpp>
#include <NGIN/Meta/TypeName.hpp>

namespace NGIN::Mirror
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Mirror"; }

} // namespace NGIN::Mirror
