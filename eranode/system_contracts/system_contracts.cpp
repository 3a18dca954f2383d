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

#include "system_contracts.hpp"

#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>

#include <silkworm/common/assert.hpp>
#include <silkworm/common/base.hpp>

#include <eranode/common/log.hpp>
#include <eranode/common/resources.hpp>
#include <eranode/common/util.hpp>
#include <eranode/system_contracts/bytecode.hpp>

namespace eranode::system_contracts {

constexpr const char* kBootloaderArtifactsDir{"etc/system-contracts/bootloader/build/artifacts"};
constexpr const char* kContractArtifactsDir{"etc/system-contracts/artifacts-zk/cache-zk/solpp-generated-contracts"};
constexpr const char* kYulContractsDir{"etc/system-contracts/contracts"};
// Placeholders with the shape of the real artifacts, replaced by scripts/refresh_contracts.sh
constexpr const char* kEmbeddedContractsDir{"contracts/"};

constexpr const char* kProvedBlockBootloader{"proved_block"};
constexpr const char* kPlaygroundBlockBootloader{"playground_block"};
constexpr const char* kFeeEstimateBootloader{"fee_estimate"};
constexpr const char* kDefaultAccount{"DefaultAccount"};
constexpr const char* kDefaultAccountNoSecurity{"DefaultAccountNoSecurity"};

using evmc::literals::operator""_address;

namespace {

struct SystemContractArtifact {
    evmc::address address;
    const char* name;
    ContractLanguage language;
    const char* directory;
};

// Genesis deployment order, empty contract at bootloader and zero addresses
constexpr SystemContractArtifact kDeployedSystemContracts[]{
    {0x0000000000000000000000000000000000008002_address, "AccountCodeStorage", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008003_address, "NonceHolder", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008004_address, "KnownCodesStorage", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008005_address, "ImmutableSimulator", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008006_address, "ContractDeployer", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008008_address, "L1Messenger", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008009_address, "MsgValueSimulator", ContractLanguage::kSolidity, ""},
    {0x000000000000000000000000000000000000800a_address, "L2EthToken", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008010_address, "Keccak256", ContractLanguage::kYul, "precompiles"},
    {0x0000000000000000000000000000000000000002_address, "SHA256", ContractLanguage::kYul, "precompiles"},
    {0x0000000000000000000000000000000000000001_address, "Ecrecover", ContractLanguage::kYul, "precompiles"},
    {0x000000000000000000000000000000000000800b_address, "SystemContext", ContractLanguage::kSolidity, ""},
    {0x000000000000000000000000000000000000800d_address, "EventWriter", ContractLanguage::kYul, ""},
    {0x000000000000000000000000000000000000800c_address, "BootloaderUtilities", ContractLanguage::kSolidity, ""},
    {0x000000000000000000636f6e736f6c652e6c6f67_address, "Console", ContractLanguage::kSolidity, ""},
    {0x000000000000000000000000000000000000800e_address, "BytecodeCompressor", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000008001_address, "EmptyContract", ContractLanguage::kSolidity, ""},
    {0x0000000000000000000000000000000000000000_address, "EmptyContract", ContractLanguage::kSolidity, ""},
};

struct ArtifactReader {
    virtual ~ArtifactReader() = default;

    //! Bytecode of the named bootloader program (Yul).
    virtual silkworm::Bytes read_bootloader(const std::string& name) = 0;

    //! Bytecode of the named system contract (Solidity).
    virtual silkworm::Bytes read_contract(const std::string& name) = 0;

    //! Bytecode of the named system contract (Yul) compiled under directory.
    virtual silkworm::Bytes read_yul_contract(const std::string& directory, const std::string& name) = 0;

    silkworm::Bytes read(const SystemContractArtifact& artifact) {
        switch (artifact.language) {
            case ContractLanguage::kSolidity: return read_contract(artifact.name);
            case ContractLanguage::kYul: return read_yul_contract(artifact.directory, artifact.name);
        }
        SILKWORM_ASSERT(false);
        return {};
    }
};

// Artifacts are fixed at build time, so any defect here is a packaging error
struct EmbeddedArtifactReader : public ArtifactReader {
    silkworm::Bytes read_bootloader(const std::string& name) override {
        return read_zbin(name);
    }

    silkworm::Bytes read_yul_contract(const std::string& /*directory*/, const std::string& name) override {
        return read_zbin(name);
    }

    silkworm::Bytes read_contract(const std::string& name) override {
        const auto artifact = resources::find_text(kEmbeddedContractsDir + name + ".json");
        SILKWORM_ASSERT(artifact.has_value());
        auto bytecode = bytecode_from_artifact(*artifact);
        SILKWORM_ASSERT(bytecode.has_value());
        SILKWORM_ASSERT(is_well_formed_bytecode(*bytecode));
        return std::move(*bytecode);
    }

  private:
    static silkworm::Bytes read_zbin(const std::string& name) {
        const auto bytecode = resources::find(kEmbeddedContractsDir + name + ".yul.zbin");
        SILKWORM_ASSERT(bytecode.has_value());
        SILKWORM_ASSERT(is_well_formed_bytecode(*bytecode));
        return silkworm::Bytes{*bytecode};
    }
};

struct LocalArtifactReader : public ArtifactReader {
    explicit LocalArtifactReader(std::filesystem::path zksync_home) : zksync_home_{std::move(zksync_home)} {}

    silkworm::Bytes read_bootloader(const std::string& name) override {
        const auto file_path = zksync_home_ / kBootloaderArtifactsDir / (name + ".yul") / (name + ".yul.zbin");
        auto bytecode = read_file(file_path);
        check_well_formed(bytecode, file_path);
        return bytecode;
    }

    silkworm::Bytes read_contract(const std::string& name) override {
        const auto file_path = zksync_home_ / kContractArtifactsDir / (name + ".sol") / (name + ".json");
        const auto content = read_file(file_path);
        auto bytecode = bytecode_from_artifact({reinterpret_cast<const char*>(content.data()), content.size()});
        if (!bytecode) {
            throw std::runtime_error{"malformed contract artifact: " + file_path.string()};
        }
        check_well_formed(*bytecode, file_path);
        return std::move(*bytecode);
    }

    silkworm::Bytes read_yul_contract(const std::string& directory, const std::string& name) override {
        const auto file_path = zksync_home_ / kYulContractsDir / directory / "artifacts" / (name + ".yul") / (name + ".yul.zbin");
        auto bytecode = read_file(file_path);
        check_well_formed(bytecode, file_path);
        return bytecode;
    }

  private:
    static silkworm::Bytes read_file(const std::filesystem::path& file_path) {
        std::ifstream file_stream{file_path, std::ios::binary};
        if (!file_stream) {
            throw std::runtime_error{"cannot read system contract artifact: " + file_path.string()};
        }
        silkworm::Bytes content(std::istreambuf_iterator<char>{file_stream}, std::istreambuf_iterator<char>{});
        ERANODE_DEBUG << "LocalArtifactReader read " << content.size() << " bytes from " << file_path.string() << "\n";
        return content;
    }

    static void check_well_formed(silkworm::ByteView bytecode, const std::filesystem::path& file_path) {
        if (!is_well_formed_bytecode(bytecode)) {
            throw std::runtime_error{"invalid bytecode length " + std::to_string(bytecode.size()) + " in " + file_path.string()};
        }
    }

    std::filesystem::path zksync_home_;
};

std::unique_ptr<ArtifactReader> make_artifact_reader(Options options, const std::filesystem::path& zksync_home) {
    switch (options) {
        case Options::kBuiltIn:
        case Options::kBuiltInWithoutSecurity: {
            return std::make_unique<EmbeddedArtifactReader>();
        }
        case Options::kLocal: {
            if (zksync_home.empty()) {
                throw std::runtime_error{"local system contracts require ZKSYNC_HOME"};
            }
            return std::make_unique<LocalArtifactReader>(zksync_home);
        }
    }
    SILKWORM_ASSERT(false);
    return nullptr;
}

SystemContractCode make_system_contract_code(const silkworm::Bytes& bytecode) {
    return SystemContractCode{bytes_to_be_words(bytecode), hash_bytecode(bytecode)};
}

} // namespace

std::ostream& operator<<(std::ostream& out, Options options) {
    out << AbslUnparseFlag(options);
    return out;
}

bool AbslParseFlag(absl::string_view text, Options* options, std::string* error) {
    if (text == "built-in") {
        *options = Options::kBuiltIn;
        return true;
    }
    if (text == "built-in-no-verify") {
        *options = Options::kBuiltInWithoutSecurity;
        return true;
    }
    if (text == "local") {
        *options = Options::kLocal;
        return true;
    }
    *error = "unknown value for system contracts options";
    return false;
}

std::string AbslUnparseFlag(Options options) {
    switch (options) {
        case Options::kBuiltIn: return "built-in";
        case Options::kBuiltInWithoutSecurity: return "built-in-no-verify";
        case Options::kLocal: return "local";
    }
    return "built-in";
}

std::ostream& operator<<(std::ostream& out, TxExecutionMode mode) {
    switch (mode) {
        case TxExecutionMode::kVerifyExecute: out << "VerifyExecute"; break;
        case TxExecutionMode::kEstimateFee: out << "EstimateFee"; break;
        case TxExecutionMode::kEthCall: out << "EthCall"; break;
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, ContractLanguage language) {
    switch (language) {
        case ContractLanguage::kSolidity: out << "Solidity"; break;
        case ContractLanguage::kYul: out << "Yul"; break;
    }
    return out;
}

DeployedContracts deployed_contracts(Options options, const std::filesystem::path& zksync_home) {
    auto reader = make_artifact_reader(options, zksync_home);

    DeployedContracts contracts;
    for (const auto& artifact : kDeployedSystemContracts) {
        contracts.push_back(DeployedContract{artifact.address, reader->read(artifact)});
        ERANODE_TRACE << "deployed_contracts " << artifact.name << " (" << artifact.language << ") at "
            << to_hex_address(artifact.address) << " size: " << contracts.back().bytecode.size() << "\n";
    }
    ERANODE_DEBUG << "deployed_contracts loaded " << contracts.size() << " " << options << " system contracts\n";
    return contracts;
}

std::ostream& operator<<(std::ostream& out, const SystemContractCode& code) {
    out << "hash: " << to_hex_bytes32(code.hash) << " words: " << code.code.size();
    return out;
}

SystemContracts SystemContracts::from_options(Options options, const std::filesystem::path& zksync_home) {
    ERANODE_INFO << "SystemContracts::from_options loading " << options << " system contracts\n";
    auto reader = make_artifact_reader(options, zksync_home);

    // Local artifacts always provide the signature checking account
    const auto default_account_name = options == Options::kBuiltInWithoutSecurity ? kDefaultAccountNoSecurity : kDefaultAccount;
    const auto default_aa = make_system_contract_code(reader->read_contract(default_account_name));
    ERANODE_DEBUG << "SystemContracts::from_options " << default_account_name << " " << default_aa << "\n";

    const auto make_bundle = [&](const char* bootloader_name) {
        const auto bootloader = make_system_contract_code(reader->read_bootloader(bootloader_name));
        ERANODE_DEBUG << "SystemContracts::from_options " << bootloader_name << " " << bootloader << "\n";
        return BaseSystemContracts{bootloader, default_aa};
    };
    return SystemContracts{make_bundle(kProvedBlockBootloader), make_bundle(kPlaygroundBlockBootloader), make_bundle(kFeeEstimateBootloader)};
}

SystemContracts::SystemContracts() : SystemContracts{from_options(Options::kBuiltIn)} {}

SystemContracts::SystemContracts(BaseSystemContracts baseline, BaseSystemContracts playground, BaseSystemContracts fee_estimate)
    : baseline_contracts_{std::move(baseline)},
      playground_contracts_{std::move(playground)},
      fee_estimate_contracts_{std::move(fee_estimate)} {}

const BaseSystemContracts& SystemContracts::contracts(TxExecutionMode mode) const noexcept {
    switch (mode) {
        case TxExecutionMode::kVerifyExecute:
            return baseline_contracts_;
        case TxExecutionMode::kEstimateFee:
            return fee_estimate_contracts_;
        case TxExecutionMode::kEthCall:
            return playground_contracts_;
    }
    return baseline_contracts_;
}

} // namespace eranode::system_contracts
