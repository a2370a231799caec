// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

namespace eva::assembly
{
    enum class AssemblyError
    {
        Success = 0,
        SizeMismatch,
        OffsetMismatch,
        RoundTripMismatch,
        ImmediateMismatch,
    };
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<eva::assembly::AssemblyError>
    : quick_status_code_from_enum_defaults<eva::assembly::AssemblyError>
{
    static constexpr auto const domain_name = "Assembly Error";
    static constexpr auto const domain_uuid =
        "3f6b1d0e-9a42-4c8e-b7d5-2e61c0a4f9b3";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
