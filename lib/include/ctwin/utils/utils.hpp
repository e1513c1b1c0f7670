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

#include <sys/stat.h>

#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace ctwin {
namespace utility {

bool is_file(const std::string& path);
bool is_directory(const std::string& path);
bool exists(const std::string& path);
bool create_directory(const std::string& path, mode_t mode);
bool remove_directory(const std::string& path);

std::string read_file(const std::string& path);
bool        write_file(const std::string& path, const std::string& content);

std::string hex_string(const std::string& in);

template<typename T, size_t N>
std::string hex_string(const std::array<T, N>& in)
{
    std::ostringstream out;
    for (unsigned char c : in) {
        out << std::hex << std::setw(2 * sizeof(T)) << std::setfill('0')
            << static_cast<uint64_t>(c);
    }
    return out.str();
}

// Returns false if the input is not an even-length hexadecimal string
bool parse_hex(const std::string& hex, std::string& out);

} // namespace utility
} // namespace ctwin
