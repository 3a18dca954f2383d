/*
   Copyright 2023 The Eranode Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <cxxabi.h>
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/flags/usage_config.h>
#include <absl/strings/match.h>
#include <absl/strings/string_view.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/process/environment.hpp>

#include <eranode/common/constants.hpp>
#include <eranode/common/log.hpp>
#include <eranode/common/util.hpp>
#include <eranode/context_pool.hpp>
#include <eranode/formatter/address_directory.hpp>
#include <eranode/formatter/lines.hpp>
#include <eranode/formatter/transaction_renderer.hpp>
#include <eranode/json/types.hpp>
#include <eranode/resolver/openchain_resolver.hpp>
#include <eranode/system_contracts/system_contracts.hpp>
#include <eranode/types/show_options.hpp>

static std::string default_zksync_home() {
    const char* zksync_home = std::getenv(eranode::kZkSyncHomeEnv);
    return zksync_home != nullptr ? zksync_home : "";
}

ABSL_FLAG(std::string, trace_file, eranode::kEmptyTraceFile, "path of the JSON dump holding one or more transaction traces");
ABSL_FLAG(eranode::ShowCalls, show_calls, eranode::ShowCalls::None, "calls to display: none, user, system, all");
ABSL_FLAG(eranode::ShowStorageLogs, show_storage_logs, eranode::ShowStorageLogs::None, "storage logs to display: none, read, write, all");
ABSL_FLAG(eranode::ShowVmDetails, show_vm_details, eranode::ShowVmDetails::None, "VM execution details to display: none, all");
ABSL_FLAG(bool, resolve_hashes, false, "resolve function and event selectors using openchain.xyz");
ABSL_FLAG(eranode::system_contracts::Options, dev_system_contracts, eranode::system_contracts::Options::kBuiltIn,
    "system contracts source: built-in, built-in-no-verify, local");
ABSL_FLAG(std::string, zksync_home, default_zksync_home(), "zkSync repository root used by local system contracts");
ABSL_FLAG(std::string, address_map, "", "path of a JSON address map replacing the built-in one");
ABSL_FLAG(std::string, openchain_host, eranode::kDefaultOpenChainHost, "signature database host as string");
ABSL_FLAG(uint32_t, timeout, eranode::kDefaultTimeout.count(), "signature database request timeout in msecs as 32-bit integer");
ABSL_FLAG(uint32_t, numContexts, std::max(1u, std::thread::hardware_concurrency() / 2), "number of running I/O contexts as 32-bit integer");
ABSL_FLAG(eranode::LogLevel, logLevel, eranode::LogLevel::Info, "logging level");

const char* currentExceptionTypeName() {
    int status;
    return abi::__cxa_demangle(abi::__cxa_current_exception_type()->name(), 0, 0, &status);
}

static std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw std::runtime_error{"cannot open trace file: " + path.string()};
    }
    return std::string{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
}

static void log_system_contracts(const eranode::system_contracts::SystemContracts& system_contracts) {
    using eranode::system_contracts::TxExecutionMode;
    for (const auto mode : {TxExecutionMode::kVerifyExecute, TxExecutionMode::kEstimateFee, TxExecutionMode::kEthCall}) {
        const auto& contracts = system_contracts.contracts(mode);
        ERANODE_DEBUG << "System contracts mode: " << mode
            << " bootloader: " << eranode::to_hex_bytes32(contracts.bootloader.hash)
            << " default_aa: " << eranode::to_hex_bytes32(contracts.default_aa.hash) << "\n";
    }
}

int main(int argc, char* argv[]) {
    const auto pid = boost::this_process::get_id();
    const auto tid = std::this_thread::get_id();

    absl::FlagsUsageConfig config;
    config.contains_helpshort_flags = [](absl::string_view) { return false; };
    config.contains_help_flags = [](absl::string_view filename) { return absl::EndsWith(filename, "main.cpp"); };
    config.contains_helppackage_flags = [](absl::string_view) { return false; };
    config.normalize_filename = [](absl::string_view f) { return std::string{f.substr(f.rfind("/") + 1)}; };
    config.version_string = []() { return "eranode_inspect 0.1.0\n"; };
    absl::SetFlagsUsageConfig(config);
    absl::SetProgramUsageMessage("Render zkSync era transaction traces and check system contracts of the in-memory node");
    absl::ParseCommandLine(argc, argv);

    ERANODE_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));

    std::set_terminate([](){
        ERANODE_CRIT << "eranode terminating with exception\n";
        try {
           auto exc = std::current_exception();
           if (exc)
               std::rethrow_exception(exc);
        } catch(const std::exception& e) {
           ERANODE_CRIT << "Caught exception: " << e.what() << "\n";
        } catch(...) {
           ERANODE_CRIT << "Type of caught exception is " << currentExceptionTypeName() << "\n";
        }

        std::abort();
    });

    try {
        auto trace_file{absl::GetFlag(FLAGS_trace_file)};
        if (trace_file.empty() || !std::filesystem::exists(trace_file)) {
            ERANODE_ERROR << "Parameter trace_file is invalid: [" << trace_file << "]\n";
            ERANODE_ERROR << "Use --trace_file flag to specify the path of the transaction traces JSON dump\n";
            return -1;
        }

        auto address_map{absl::GetFlag(FLAGS_address_map)};
        if (!address_map.empty() && !std::filesystem::exists(address_map)) {
            ERANODE_ERROR << "Parameter address_map is invalid: [" << address_map << "]\n";
            ERANODE_ERROR << "Use --address_map flag to specify the path of a JSON address map\n";
            return -1;
        }

        auto dev_system_contracts{absl::GetFlag(FLAGS_dev_system_contracts)};
        auto zksync_home{absl::GetFlag(FLAGS_zksync_home)};
        if (dev_system_contracts == eranode::system_contracts::Options::kLocal && zksync_home.empty()) {
            ERANODE_ERROR << "Parameter zksync_home is invalid: [" << zksync_home << "]\n";
            ERANODE_ERROR << "Use --zksync_home flag or ZKSYNC_HOME variable to specify the zkSync root for local system contracts\n";
            return -1;
        }

        auto openchain_host{absl::GetFlag(FLAGS_openchain_host)};
        if (openchain_host.empty()) {
            ERANODE_ERROR << "Parameter openchain_host is invalid: [" << openchain_host << "]\n";
            ERANODE_ERROR << "Use --openchain_host flag to specify the signature database host\n";
            return -1;
        }

        auto timeout{absl::GetFlag(FLAGS_timeout)};
        if (timeout == 0) {
            ERANODE_ERROR << "Parameter timeout is invalid: [" << timeout << "]\n";
            ERANODE_ERROR << "Use --timeout flag to specify the timeout in msecs for signature database requests\n";
            return -1;
        }

        auto numContexts{absl::GetFlag(FLAGS_numContexts)};
        if (numContexts == 0) {
            ERANODE_ERROR << "Parameter numContexts is invalid: [" << numContexts << "]\n";
            ERANODE_ERROR << "Use --numContexts flag to specify the number of threads running I/O contexts\n";
            return -1;
        }

        ERANODE_DEBUG << "eranode_inspect launched with trace_file " << trace_file << " using " << numContexts << " contexts"
            << " [pid=" << pid << ", main thread=" << tid << "]\n";

        const auto system_contracts = eranode::system_contracts::SystemContracts::from_options(dev_system_contracts, zksync_home);
        ERANODE_INFO << "System contracts: " << dev_system_contracts << "\n";
        log_system_contracts(system_contracts);
        const auto genesis_contracts = eranode::system_contracts::deployed_contracts(dev_system_contracts, zksync_home);
        ERANODE_DEBUG << "Genesis system contracts: " << genesis_contracts.size() << "\n";

        const auto directory = address_map.empty() ?
            eranode::AddressDirectory::builtin() : eranode::AddressDirectory::from_file(address_map);
        ERANODE_DEBUG << "Address directory loaded with " << directory.size() << " known addresses\n";

        const auto traces = eranode::parse_transaction_traces(read_file(trace_file));
        ERANODE_DEBUG << "Trace file contains " << traces.size() << " transactions\n";

        eranode::RenderOptions options;
        options.show_calls = absl::GetFlag(FLAGS_show_calls);
        options.show_storage_logs = absl::GetFlag(FLAGS_show_storage_logs);
        options.show_vm_details = absl::GetFlag(FLAGS_show_vm_details);
        options.resolve_hashes = absl::GetFlag(FLAGS_resolve_hashes);

        eranode::resolver::OpenChainSettings settings;
        settings.host = openchain_host;
        settings.timeout = std::chrono::milliseconds{timeout};
        eranode::resolver::OpenChainResolver resolver{settings};

        eranode::ContextPool context_pool{numContexts};
        context_pool.start();

        std::vector<std::future<eranode::Lines>> reports;
        reports.reserve(traces.size());
        for (const auto& trace : traces) {
            auto& io_context = context_pool.next_io_context();
            reports.push_back(boost::asio::co_spawn(io_context,
                eranode::render_transaction(trace, options, directory, resolver), boost::asio::use_future));
        }
        for (auto& report : reports) {
            eranode::print_lines(report.get());
        }

        context_pool.stop();
        context_pool.join();
    } catch (const std::exception& e) {
        ERANODE_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        return -1;
    } catch (...) {
        ERANODE_CRIT << "Unexpected exception\n" << std::flush;
        ERANODE_CRIT << "Type of caught exception is " << currentExceptionTypeName() << "\n";
        return -1;
    }

    ERANODE_DEBUG << "eranode_inspect exiting [pid=" << pid << ", main thread=" << tid << "]\n" << std::flush;

    return 0;
}
