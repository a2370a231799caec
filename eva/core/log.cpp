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

#include <eva/core/config.hpp>
#include <eva/core/log.hpp>

#include <quill/Quill.h>

#include <mutex>

EVA_NAMESPACE_BEGIN

void start_logging(quill::LogLevel const level)
{
    static std::once_flag started;

    std::call_once(started, [] {
        auto stdout_handler = quill::stdout_handler();
        stdout_handler->set_pattern(
            "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)"
            "\t%(message)",
            "%Y-%m-%d %H:%M:%S.%Qns",
            quill::Timezone::GmtTime);
        quill::Config cfg;
        cfg.default_handlers.emplace_back(stdout_handler);
        quill::configure(cfg);
        quill::start(true);
    });

    quill::get_root_logger()->set_log_level(level);
}

EVA_NAMESPACE_END
