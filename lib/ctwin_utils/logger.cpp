//
// CTwin - Confidential Tunnel-Boring-Machine Telemetry Ledger
// Copyright (C) 2026 CTwin contributors
//
// This file is part of CTwin.
//
// CTwin is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as
// published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version.
//
// CTwin is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with CTwin.  If not, see <http://www.gnu.org/licenses/>.
//

#include <ctwin/utils/logger.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace ctwin {
namespace logger {

std::shared_ptr<spdlog::logger> shared_logger_(nullptr);

std::shared_ptr<spdlog::logger> logger()
{
    if (!shared_logger_) {
        // initialize the logger
        shared_logger_ = spdlog::stderr_color_mt("ctwin");
    }
    return shared_logger_;
}

void set_logging_level(spdlog::level::level_enum log_level)
{
    logger()->set_level(log_level);
}

spdlog::level::level_enum parse_logging_level(const std::string& name)
{
    spdlog::level::level_enum level = spdlog::level::from_str(name);

    // from_str returns off for anything it does not know
    if (level == spdlog::level::off && name != "off") {
        logger()->warn("Unknown logging level '{}', using info", name);
        return spdlog::level::info;
    }
    return level;
}

} // namespace logger
} // namespace ctwin
