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

#include "utility.hpp"

#include <ctwin/utils/rocksdb_wrapper.hpp>
#include <ctwin/utils/utils.hpp>

#include <rocksdb/write_batch.h>

#include <array>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace ctwin {
namespace utility {
namespace test {

constexpr auto utils_test_dir   = "utils_test";
constexpr auto rocksdb_test_dir = "rocksdb_store_test";

TEST(utils, hex)
{
    EXPECT_EQ(hex_string(std::string("\x00\x1f\xab", 3)), "001fab");

    std::array<uint8_t, 3> bytes{{0xde, 0xad, 0x01}};
    EXPECT_EQ(hex_string(bytes), "dead01");

    std::string out;
    ASSERT_TRUE(parse_hex("DEad01", out));
    EXPECT_EQ(out, std::string(bytes.begin(), bytes.end()));

    ASSERT_TRUE(parse_hex("", out));
    EXPECT_TRUE(out.empty());

    EXPECT_FALSE(parse_hex("abc", out));
    EXPECT_FALSE(parse_hex("zz", out));
}

TEST(utils, files)
{
    ctwin::test::cleanup_directory(utils_test_dir);

    const std::string dir  = std::string(utils_test_dir) + "/nested";
    const std::string path = dir + "/key";

    EXPECT_TRUE(is_directory(utils_test_dir));
    ASSERT_TRUE(create_directory(dir, 0700));
    EXPECT_FALSE(create_directory(dir, 0700));

    ASSERT_TRUE(write_file(path, std::string("k\0y", 3)));
    EXPECT_TRUE(is_file(path));
    EXPECT_FALSE(is_file(dir));
    EXPECT_EQ(read_file(path), std::string("k\0y", 3));

    ASSERT_TRUE(remove_directory(utils_test_dir));
    EXPECT_FALSE(exists(path));
    EXPECT_FALSE(exists(utils_test_dir));

    // nothing to remove
    EXPECT_TRUE(remove_directory(utils_test_dir));
    EXPECT_THROW(read_file(path), std::runtime_error);
}

TEST(rocksdb_store, get_write_scan)
{
    ctwin::test::cleanup_directory(rocksdb_test_dir);

    std::vector<std::pair<std::string, std::string>> scanned;
    {
        RocksDBStore store(std::string(rocksdb_test_dir) + "/db");

        // an absent key is not an error
        std::string value = "untouched";
        EXPECT_FALSE(store.get("m/missing", value));

        rocksdb::WriteBatch batch;
        batch.Put("t/2", "two");
        batch.Put("t/1", "one");
        batch.Put("u/1", "other table");
        ASSERT_TRUE(store.write(batch));

        ASSERT_TRUE(store.get("t/1", value));
        EXPECT_EQ(value, "one");
        EXPECT_FALSE(store.get("t/3", value));

        store.scan("t/", [&](const std::string& k, const std::string& v) {
            scanned.emplace_back(k, v);
        });
        store.flush();
    }

    ASSERT_EQ(scanned.size(), 2);
    EXPECT_EQ(scanned[0].first, "t/1");
    EXPECT_EQ(scanned[1].second, "two");

    // the updates survive a reopening
    RocksDBStore store(std::string(rocksdb_test_dir) + "/db");
    std::string  value;
    ASSERT_TRUE(store.get("u/1", value));
    EXPECT_EQ(value, "other table");
}

} // namespace test
} // namespace utility
} // namespace ctwin
