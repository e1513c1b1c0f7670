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

#include <sse/crypto/utils.hpp>

#include <gtest/gtest.h>

//  Google Test takes care of everything
//  Tests are automatically registered and run

int main(int argc, char* argv[])
{
    sse::crypto::init_crypto_lib();

    ctwin::logger::set_logging_level(spdlog::level::warn);

    ::testing::InitGoogleTest(&argc, argv);

    int rv = RUN_ALL_TESTS();

    sse::crypto::cleanup_crypto_lib();

    return rv;
}
