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

#include <eva/assembly/assembly_error.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/generic_code.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<eva::assembly::AssemblyError>::mapping> const &
quick_status_code_from_enum<eva::assembly::AssemblyError>::value_mappings()
{
    using eva::assembly::AssemblyError;

    static std::initializer_list<mapping> const v = {
        {AssemblyError::Success, "success", {errc::success}},
        {AssemblyError::SizeMismatch,
         "instruction size disagrees with its immediate payload",
         {}},
        {AssemblyError::OffsetMismatch,
         "instruction offset is not contiguous with its predecessor",
         {}},
        {AssemblyError::RoundTripMismatch,
         "reassembled bytes differ from the original code",
         {}},
        {AssemblyError::ImmediateMismatch,
         "immediate payload would not decode back to the same instruction",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
