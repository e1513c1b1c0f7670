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

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ctwin {
namespace logger {

std::shared_ptr<spdlog::logger> logger();

void set_logging_level(spdlog::level::level_enum log_level);

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names fall back to info.
spdlog::level::level_enum parse_logging_level(const std::string& name);

} // namespace logger
} // namespace ctwin
