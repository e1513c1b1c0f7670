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

#include <ctwin/utils/utils.hpp>

#include <cerrno>
#include <cstring>
#include <fts.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <utility>

namespace ctwin {
namespace utility {

bool is_file(const std::string& path)
{
    struct stat sb;

    return (stat(path.c_str(), &sb) == 0 && S_ISREG(sb.st_mode));
}

bool is_directory(const std::string& path)
{
    struct stat sb;

    return (stat(path.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode));
}

bool exists(const std::string& path)
{
    struct stat sb;

    return (stat(path.c_str(), &sb) == 0);
}

bool create_directory(const std::string& path, mode_t mode)
{
    return mkdir(path.data(), mode) == 0;
}

bool remove_directory(const std::string& path)
{
    if (!exists(path)) {
        return true;
    }

    std::array<char*, 2> files = {const_cast<char*>(path.c_str()), nullptr};

    // FTS_PHYSICAL: never follow symlinks out of the directory
    FTS* ftsp = fts_open(
        files.data(), FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV, nullptr);
    if (ftsp == nullptr) {
        throw std::runtime_error("When deleting directory " + path
                                 + ": fts_open failed: " + strerror(errno));
    }

    FTSENT* curr;

    while ((curr = fts_read(ftsp)) != nullptr) {
        switch (curr->fts_info) {
        case FTS_NS:
        case FTS_DNR:
        case FTS_ERR: {
            std::string message = "When deleting directory " + path + ": "
                                  + curr->fts_accpath + ": fts_read error: "
                                  + strerror(curr->fts_errno);
            fts_close(ftsp);
            throw std::runtime_error(message);
        }

        case FTS_D:
            // directories are removed in post-order (FTS_DP)
            break;

        case FTS_DP:
        case FTS_F:
        case FTS_SL:
        case FTS_SLNONE:
        case FTS_DEFAULT: {
            if (remove(curr->fts_accpath) < 0) {
                std::string message = "When deleting directory " + path
                                      + ": failed to remove "
                                      + curr->fts_accpath + ": "
                                      + strerror(errno);
                fts_close(ftsp);
                throw std::runtime_error(message);
            }
            break;
        }
        default:
            break;
        }
    }

    fts_close(ftsp);

    return true;
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path.c_str(), std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error(path + ": unable to open file");
    }

    std::stringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

bool write_file(const std::string& path, const std::string& content)
{
    std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << content;
    out.close();

    return !out.fail();
}

std::string hex_string(const std::string& in)
{
    std::ostringstream out;
    for (unsigned char c : in) {
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<uint>(c);
    }
    return out.str();
}

static int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool parse_hex(const std::string& hex, std::string& out)
{
    if (hex.size() % 2 != 0) {
        return false;
    }

    std::string result;
    result.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        result.push_back(static_cast<char>((hi << 4) | lo));
    }

    out = std::move(result);
    return true;
}

} // namespace utility
} // namespace ctwin
