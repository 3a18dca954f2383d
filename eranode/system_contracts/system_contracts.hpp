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

#ifndef ERANODE_SYSTEM_CONTRACTS_SYSTEM_CONTRACTS_HPP_
#define ERANODE_SYSTEM_CONTRACTS_SYSTEM_CONTRACTS_HPP_

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <absl/strings/string_view.h>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkworm/common/base.hpp>

namespace eranode::system_contracts {

//! Source of the system contracts bytecode.
enum class Options {
    kBuiltIn,                 // compiled into the binary
    kLocal,                   // loaded at startup from the ZKSYNC_HOME artifacts
    kBuiltInWithoutSecurity,  // compiled in, default account skipping signature checks (testing only)
};

std::ostream& operator<<(std::ostream& out, Options options);

bool AbslParseFlag(absl::string_view text, Options* options, std::string* error);
std::string AbslUnparseFlag(Options options);

enum class TxExecutionMode {
    kVerifyExecute,
    kEstimateFee,
    kEthCall
};

std::ostream& operator<<(std::ostream& out, TxExecutionMode mode);

struct SystemContractCode {
    std::vector<intx::uint256> code;
    evmc::bytes32 hash;
};

struct BaseSystemContracts {
    SystemContractCode bootloader;
    SystemContractCode default_aa;
};

enum class ContractLanguage {
    kSolidity,
    kYul
};

std::ostream& operator<<(std::ostream& out, ContractLanguage language);

struct DeployedContract {
    evmc::address address;
    silkworm::Bytes bytecode;
};

typedef std::vector<DeployedContract> DeployedContracts;

//! System contracts deployed at genesis, read from the source selected by options.
//! Throws std::runtime_error when kLocal artifacts are missing or malformed under zksync_home.
DeployedContracts deployed_contracts(Options options, const std::filesystem::path& zksync_home = {});

//! The three immutable bootloader and default account bundles, one per execution mode.
class SystemContracts {
  public:
    //! Throws std::runtime_error when kLocal artifacts are missing or malformed under zksync_home.
    static SystemContracts from_options(Options options, const std::filesystem::path& zksync_home = {});

    //! Compiled-in contracts.
    SystemContracts();

    const BaseSystemContracts& contracts(TxExecutionMode mode) const noexcept;

    const BaseSystemContracts& contracts_for_l2_call() const noexcept { return contracts(TxExecutionMode::kEthCall); }
    const BaseSystemContracts& contracts_for_fee_estimate() const noexcept { return contracts(TxExecutionMode::kEstimateFee); }

    const BaseSystemContracts& baseline_contracts() const noexcept { return baseline_contracts_; }
    const BaseSystemContracts& playground_contracts() const noexcept { return playground_contracts_; }
    const BaseSystemContracts& fee_estimate_contracts() const noexcept { return fee_estimate_contracts_; }

  private:
    SystemContracts(BaseSystemContracts baseline, BaseSystemContracts playground, BaseSystemContracts fee_estimate);

    // real contracts doing all the checks
    BaseSystemContracts baseline_contracts_;
    // read-only calls, lower fixed gas limit
    BaseSystemContracts playground_contracts_;
    // unsigned requests with changing gas limit, invalid signatures ignored
    BaseSystemContracts fee_estimate_contracts_;
};

std::ostream& operator<<(std::ostream& out, const SystemContractCode& code);

} // namespace eranode::system_contracts

#endif  // ERANODE_SYSTEM_CONTRACTS_SYSTEM_CONTRACTS_HPP_
