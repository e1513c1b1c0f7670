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

#include <ctwin/ledger/errors.hpp>
#include <ctwin/ledger/types.hpp>
#include <ctwin/runners/ledger_client_runner.hpp>
#include <ctwin/utils/logger.hpp>
#include <ctwin/utils/utils.hpp>

#include <sse/crypto/utils.hpp>

#include <cstdio>
#include <grpcpp/grpcpp.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <list>
#include <stdexcept>
#include <string>
#include <vector>

using ctwin::ledger::CiphertextHandle;
using ctwin::ledger::CiphertextKind;

// Handles are given as kind:hex, e.g. scalar:00ff...
static bool parse_handle(const std::string& arg, CiphertextHandle& handle)
{
    size_t sep = arg.find(':');
    if (sep == std::string::npos) {
        return false;
    }

    std::string kind = arg.substr(0, sep);
    if (kind == "scalar") {
        handle.kind = CiphertextKind::Scalar;
    } else if (kind == "text") {
        handle.kind = CiphertextKind::Text;
    } else if (kind == "counter") {
        handle.kind = CiphertextKind::Counter;
    } else {
        return false;
    }

    std::string id;
    if (!ctwin::utility::parse_hex(arg.substr(sep + 1), id)
        || id.size() != handle.id.size()) {
        return false;
    }
    std::copy(id.begin(), id.end(), handle.id.begin());
    return true;
}

static void print_jobs(const std::vector<ctwin::ledger::DecryptionJob>& jobs)
{
    for (const auto& job : jobs) {
        std::cout << "request " << job.request_id << ":";
        for (const auto& ct : job.ciphertexts) {
            std::cout << " " << ctwin::ledger::to_string(ct);
        }
        std::cout << "\n";
    }
}

static int run(const ctwin::ledger::LedgerClientRunner& client,
               char                                     command,
               const std::string&                       argument,
               const std::string&                       proof,
               const std::list<std::string>&            args)
{
    switch (command) {
    case 's': {
        if (args.size() != ctwin::ledger::kRecordFieldCount) {
            ctwin::logger::logger()->error(
                "A record has {} fields (position, torque, speed, soil "
                "type), got {}",
                ctwin::ledger::kRecordFieldCount,
                args.size());
            return 1;
        }
        ctwin::ledger::record_fields_type fields;
        size_t                            i = 0;
        for (const auto& arg : args) {
            if (!parse_handle(arg, fields[i++])) {
                ctwin::logger::logger()->error("Invalid handle: " + arg);
                return 1;
            }
        }
        std::cout << "record " << client.submit_record(fields) << "\n";
        break;
    }
    case 'r':
        std::cout << "request "
                  << client.request_record_reveal(std::stoull(argument))
                  << "\n";
        break;
    case 'c':
        std::cout << "request " << client.request_counter_reveal(argument)
                  << "\n";
        break;
    case 'x': {
        std::string raw_proof;
        if (!ctwin::utility::parse_hex(proof, raw_proof)) {
            ctwin::logger::logger()->error("Invalid proof: " + proof);
            return 1;
        }
        client.complete_reveal(
            std::stoull(argument),
            std::vector<std::string>(args.begin(), args.end()),
            raw_proof);
        std::cout << "request " << argument << " completed\n";
        break;
    }
    case 'g': {
        ctwin::ledger::RecordView view
            = client.get_record(std::stoull(argument));
        if (!view.exists) {
            std::cout << "record " << argument << " does not exist\n";
            break;
        }
        std::cout << "record " << argument << ": "
                  << ctwin::ledger::to_string(view.status)
                  << ", submitted at " << view.submitted_at << "\n";
        for (const auto& clear : view.decrypted.cleartext) {
            std::cout << "  " << clear << "\n";
        }
        break;
    }
    case 'n': {
        ctwin::ledger::CounterView view = client.get_counter(argument);
        std::cout << "counter '" << argument
                  << "': " << ctwin::ledger::to_string(view.handle);
        if (view.revealed) {
            std::cout << ", last revealed value " << view.revealed_value;
        }
        std::cout << "\n";
        break;
    }
    case 'j':
        print_jobs(client.decryption_jobs());
        break;
    case 'i': {
        ctwin::ledger::LedgerAvailability avail = client.availability();
        std::cout << (avail.available ? "available" : "unavailable") << ", "
                  << avail.record_count << " records, "
                  << avail.pending_requests << " pending requests\n";
        break;
    }
    default:
        ctwin::logger::logger()->error("No command given");
        return 1;
    }
    return 0;
}

int main(int argc, char** argv)
{
    ctwin::logger::set_logging_level(spdlog::level::info);

    sse::crypto::init_crypto_lib();

    opterr = 0;
    int c;

    std::string server_address = "localhost:4242";
    std::string caller;
    std::string argument;
    std::string proof;
    char        command = 0;

    while ((c = getopt(argc, argv, "a:u:sr:c:x:p:g:n:jiv:")) != -1) {
        switch (c) {
        case 'a':
            server_address = std::string(optarg);
            break;
        case 'u':
            caller = std::string(optarg);
            break;
        case 's':
        case 'j':
        case 'i':
            command = static_cast<char>(c);
            break;
        case 'r':
        case 'c':
        case 'x':
        case 'g':
        case 'n':
            command  = static_cast<char>(c);
            argument = std::string(optarg);
            break;
        case 'p':
            proof = std::string(optarg);
            break;
        case 'v':
            ctwin::logger::set_logging_level(
                ctwin::logger::parse_logging_level(optarg));
            break;
        case '?':
            if (optopt == 'a' || optopt == 'u' || optopt == 'r'
                || optopt == 'c' || optopt == 'x' || optopt == 'p'
                || optopt == 'g' || optopt == 'n' || optopt == 'v') {
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

    std::list<std::string> args;
    for (int index = optind; index < argc; index++) {
        args.emplace_back(argv[index]);
    }

    ctwin::ledger::LedgerClientRunner client(
        grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials()),
        caller);

    int rv = 1;
    try {
        rv = run(client, command, argument, proof, args);
    } catch (const ctwin::ledger::LedgerError& e) {
        ctwin::logger::logger()->error("Rejected by the ledger: "
                                       + std::string(e.what()));
    } catch (const std::exception& e) {
        ctwin::logger::logger()->error(e.what());
    }

    sse::crypto::cleanup_crypto_lib();

    return rv;
}
