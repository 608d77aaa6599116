// ETHLEDGER CLI - Command Line Interface
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// The ethledger-cli tool lists accounts and signs transactions and messages
// through the signing subprovider. It drives the software debug device, so
// it is meant for development and testing only.

#include <ethledger/device/debug_device.h>
#include <ethledger/rpc/wallet_handler.h>
#include <ethledger/signer/config.h>
#include <ethledger/signer/subprovider.h>
#include <ethledger/util/config.h>
#include <ethledger/util/logging.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace ethledger {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ETHLEDGER CLI";

namespace ck = util::ConfigKeys;

// ============================================================================
// Help
// ============================================================================

void PrintVersion() {
    std::cout << CLIENT_NAME << " version " << VERSION << "\n";
}

void PrintHelp() {
    PrintVersion();
    std::cout << "\n"
        << "Usage: ethledger-cli [options] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  accounts [n]                  List the first n accounts\n"
        << "  signmessage <hex> <address>   Sign a personal message\n"
        << "  signtx <json>                 Sign a transaction object\n"
        << "  path [new-path]               Show or change the base derivation path\n"
        << "  rpc <json-request>            Answer a JSON-RPC wallet request\n"
        << "\n"
        << "Options:\n"
        << "  -conf=<file>                  Read options from <file>\n"
        << "  -mnemonic=<words>             Debug device mnemonic (required)\n"
        << "  -passphrase=<text>            BIP39 passphrase\n"
        << "  -networkid=<id>               Chain id (required)\n"
        << "  -derivationpath=<path>        Base path (default 44'/60'/0')\n"
        << "  -askconfirmation              Confirm addresses on the device\n"
        << "  -addresssearchlimit=<n>       Children scanned for an address (default 1000)\n"
        << "  -numaddresses=<n>             Accounts listed by default (default 20)\n"
        << "  -hardfork=<name>              spuriousDragon, berlin or london (default)\n"
        << "  -loglevel=<level>             trace, debug, info, warn, error, off\n"
        << "  -debug[=<categories>]         Debug output, optionally only for\n"
        << "                                device, signer, wallet, rpc, config\n";
}

// ============================================================================
// Output
// ============================================================================

template<typename T>
int ReportFailure(const signer::SignerResult<T>& result) {
    std::cerr << "error: " << signer::SignerErrorToString(result.error);
    if (!result.message.empty()) {
        std::cerr << ": " << result.message;
    }
    std::cerr << "\n";
    return 2;
}

int Usage(const std::string& message) {
    std::cerr << "error: " << message << "\n"
              << "Use 'ethledger-cli help' for usage information.\n";
    return 1;
}

// ============================================================================
// Commands
// ============================================================================

int RunCommand(signer::SigningSubprovider& subprovider,
               const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "accounts") {
        std::optional<uint32_t> count;
        if (args.size() > 1) {
            char* end = nullptr;
            unsigned long n = std::strtoul(args[1].c_str(), &end, 10);
            if (args[1].empty() || *end != '\0' || n == 0 || n > 100000) {
                return Usage("accounts expects a positive count");
            }
            count = static_cast<uint32_t>(n);
        }
        auto result = subprovider.GetAccounts(count);
        if (!result) return ReportFailure(result);
        for (const auto& account : *result.value) {
            std::cout << account << "\n";
        }
        return 0;
    }

    if (command == "signmessage") {
        if (args.size() != 3) {
            return Usage("signmessage expects <hex> <address>");
        }
        auto result = subprovider.SignPersonalMessage(args[1], args[2]);
        if (!result) return ReportFailure(result);
        std::cout << *result.value << "\n";
        return 0;
    }

    if (command == "signtx") {
        if (args.size() != 2) {
            return Usage("signtx expects one JSON object");
        }
        auto json = rpc::JSONValue::TryParse(args[1]);
        if (!json) {
            return Usage("signtx argument is not valid JSON");
        }
        std::string error;
        auto params = rpc::TxParamsFromJSON(*json, &error);
        if (!params) {
            return Usage(error);
        }
        auto result = subprovider.SignTransaction(*params);
        if (!result) return ReportFailure(result);
        std::cout << *result.value << "\n";
        return 0;
    }

    if (command == "path") {
        if (args.size() > 2) {
            return Usage("path expects at most one argument");
        }
        if (args.size() == 2) {
            signer::SignerStatus status = subprovider.SetPath(args[1]);
            if (!status) {
                std::cerr << "error: " << signer::SignerErrorToString(status.error)
                          << ": " << status.message << "\n";
                return 2;
            }
        }
        std::cout << subprovider.GetPath() << "\n";
        return 0;
    }

    return Usage("unknown command '" + command + "'");
}

// ============================================================================
// Main Application
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;

    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        return Usage(parsed.errorMessage);
    }

    const std::vector<std::string> args = config.GetPositionalArgs();
    if (args.empty() || args[0] == "help" || config.GetBool("help", false)) {
        PrintHelp();
        return args.empty() && !config.GetBool("help", false) ? 1 : 0;
    }
    if (args[0] == "version" || config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    if (auto confFile = config.TryGetString(ck::CONF)) {
        // File values must not override the command line
        util::ConfigManager fileConfig;
        auto fileResult = fileConfig.ParseFile(*confFile);
        if (!fileResult.success) {
            std::cerr << "error: " << fileResult.errorMessage;
            if (fileResult.errorLine > 0) std::cerr << " (line " << fileResult.errorLine << ")";
            std::cerr << "\n";
            return 1;
        }
        config.MergeDefaults(fileConfig);
    }

    util::LogLevel level = util::LogLevel::Warn;
    if (auto debug = config.TryGetString(ck::DEBUG)) {
        // -debug=0 turns it off, -debug=device,signer narrows it
        if (*debug != "0" && *debug != "false") {
            level = util::LogLevel::Debug;
            util::Logger::Instance().SetCategoryFilter(*debug);
        }
    }
    if (auto name = config.TryGetString(ck::LOGLEVEL)) {
        level = util::LogLevelFromString(*name);
    }
    util::Logger::Instance().Initialize(level);

    auto signerConfig = signer::LoadSubproviderConfig(config);
    if (!signerConfig) {
        return ReportFailure(signerConfig);
    }

    auto mnemonic = config.TryGetString(ck::MNEMONIC);
    if (!mnemonic || mnemonic->empty()) {
        return Usage("-mnemonic is required for the debug device");
    }
    auto factory = device::DebugDeviceFactory::FromMnemonic(
        *mnemonic, config.GetString(ck::PASSPHRASE, ""));

    auto created = signer::SigningSubprovider::Create(factory, *signerConfig.value);
    if (!created) {
        return ReportFailure(created);
    }
    std::shared_ptr<signer::SigningSubprovider> subprovider = *created.value;

    int rc = 0;
    if (args[0] == "rpc") {
        if (args.size() != 2) {
            rc = Usage("rpc expects one JSON request");
        } else {
            rpc::WalletRequestHandler handler(subprovider);
            std::cout << handler.HandleJSON(args[1]) << "\n";
        }
    } else {
        rc = RunCommand(*subprovider, args);
    }

    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace cli
} // namespace ethledger

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return ethledger::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
