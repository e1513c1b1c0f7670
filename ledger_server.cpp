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

#include <ctwin/runners/ledger_server_runner.hpp>
#include <ctwin/utils/logger.hpp>

#include <sse/crypto/utils.hpp>

#include <csignal>
#include <cstdio>
#include <unistd.h>

#include <exception>
#include <memory>

ctwin::ledger::LedgerServerRunner* g_ledger_server_ptr_ = nullptr;

void exit_handler(__attribute__((unused)) int signal)
{
    ctwin::logger::logger()->info("Exiting... ");

    if (g_ledger_server_ptr_ != nullptr) {
        g_ledger_server_ptr_->shutdown();
    }
};


int main(int argc, char** argv)
{
    ctwin::logger::set_logging_level(spdlog::level::info);

    std::signal(SIGTERM, exit_handler);
    std::signal(SIGINT, exit_handler);
    std::signal(SIGQUIT, exit_handler);

    sse::crypto::init_crypto_lib();

    opterr = 0;
    int c;

    std::string storage_path;
    std::string server_address = "0.0.0.0:4242";
    std::string oracle_key_path;

    while ((c = getopt(argc, argv, "b:a:k:v:")) != -1) {
        switch (c) {
        case 'b':
            storage_path = std::string(optarg);
            break;
        case 'a':
            server_address = std::string(optarg);
            break;
        case 'k':
            oracle_key_path = std::string(optarg);
            break;
        case 'v':
            ctwin::logger::set_logging_level(
                ctwin::logger::parse_logging_level(optarg));
            break;

        case '?':
            if (optopt == 'b' || optopt == 'a' || optopt == 'k'
                || optopt == 'v') {
                fprintf(stderr, "Option -%c requires an argument.\n", optopt);
            } else if (isprint(optopt) != 0) {
                fprintf(stderr, "Unknown option `-%c'.\n", optopt);
            } else {
                fprintf(stderr, "Unknown option character `\\x%x'.\n", optopt);
            }
            return 1;
        default:
            exit(-1);
        }
    }

    if (storage_path.empty()) {
        ctwin::logger::logger()->warn(
            "Ledger storage not specified. Using \'ctwin.ledger\' by default");
        storage_path = "ctwin.ledger";
    } else {
        ctwin::logger::logger()->info("Running ledger with storage "
                                      + storage_path);
    }

    std::unique_ptr<ctwin::ledger::LedgerServerRunner> runner;
    try {
        runner.reset(new ctwin::ledger::LedgerServerRunner(
            server_address, storage_path, oracle_key_path));
    } catch (const std::exception& e) {
        ctwin::logger::logger()->critical("Unable to start the ledger: "
                                          + std::string(e.what()));
        sse::crypto::cleanup_crypto_lib();
        return 1;
    }
    g_ledger_server_ptr_ = runner.get();

    g_ledger_server_ptr_->wait();

    g_ledger_server_ptr_ = nullptr;
    runner.reset();

    sse::crypto::cleanup_crypto_lib();

    ctwin::logger::logger()->info("Ledger exited");

    return 0;
}
