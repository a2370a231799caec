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

#include <eva/core/config.hpp>

#include <quill/Quill.h>

EVA_NAMESPACE_BEGIN

/// Configure the root logger with a stdout handler and start the quill
/// backend thread. Safe to call more than once; only the first call
/// configures, later calls only adjust the log level.
void start_logging(quill::LogLevel level = quill::LogLevel::Info);

EVA_NAMESPACE_END
