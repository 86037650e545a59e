// ARBITER - Protocol Options
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/options.h>

#include <arbiter/resolution/store.h>

#include <optional>
#include <stdexcept>

namespace arbiter {
namespace resolution {

namespace {

std::optional<Address> ParseAddress(std::string hex) {
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (hex.size() != Address::SIZE * 2) {
        return std::nullopt;
    }
    try {
        return Address::FromHex(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

/// Strict boolean lookup; false when the key holds something unparsable
bool ReadBool(const util::ConfigManager& config, const char* key, const char* section,
              bool& out) {
    auto raw = config.TryGetString(key, section);
    if (!raw) {
        return true;
    }
    auto parsed = util::ConfigManager::ParseBool(*raw);
    if (!parsed) {
        return false;
    }
    out = *parsed;
    return true;
}

} // namespace

util::ConfigParseResult LoadProtocolOptions(const util::ConfigManager& config,
                                            ProtocolOptions& options) {
    namespace keys = util::ConfigKeys;

    ProtocolOptions loaded;

    for (const std::string& entry : config.GetList(keys::MANAGER, keys::SECTION_ORACLE)) {
        auto address = ParseAddress(entry);
        if (!address) {
            return util::ConfigParseResult::Error("invalid manager address: " + entry);
        }
        loaded.managers.insert(*address);
    }

    if (auto level = config.TryGetString(keys::LEVEL, keys::SECTION_LOG)) {
        if (!util::TryParseLogLevel(*level, loaded.logLevel)) {
            return util::ConfigParseResult::Error("invalid log level: " + *level);
        }
    }
    loaded.logFile = config.GetString(keys::FILE, "", keys::SECTION_LOG);
    if (!ReadBool(config, keys::CONSOLE, keys::SECTION_LOG, loaded.logToConsole)) {
        return util::ConfigParseResult::Error("log.console must be a boolean");
    }

    if (!ReadBool(config, keys::ENABLED, keys::SECTION_STORE, loaded.storeEnabled)) {
        return util::ConfigParseResult::Error("store.enabled must be a boolean");
    }
    loaded.storePath = config.GetString(keys::PATH, "", keys::SECTION_STORE);
    if (loaded.storeEnabled && loaded.storePath.empty()) {
        return util::ConfigParseResult::Error("store.enabled requires store.path");
    }

    util::ConfigManager checker = config;
    checker.AllowKey(keys::MANAGER, keys::SECTION_ORACLE);
    checker.AllowKey(keys::LEVEL, keys::SECTION_LOG);
    checker.AllowKey(keys::FILE, keys::SECTION_LOG);
    checker.AllowKey(keys::CONSOLE, keys::SECTION_LOG);
    checker.AllowKey(keys::ENABLED, keys::SECTION_STORE);
    checker.AllowKey(keys::PATH, keys::SECTION_STORE);

    util::ConfigParseResult result = util::ConfigParseResult::Success();
    result.warnings = checker.Validate();
    for (const auto& warning : result.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    options = std::move(loaded);
    return result;
}

bool ApplyLoggingOptions(const ProtocolOptions& options) {
    return util::InitLogging(options.logLevel, options.logToConsole, options.logFile);
}

db::Status OpenConfiguredStore(const ProtocolOptions& options,
                               std::unique_ptr<ResolutionStore>& out) {
    out.reset();
    if (!options.storeEnabled) {
        return db::Status::Ok();
    }
    auto [status, store] = ResolutionStore::Open(options.storePath);
    if (status.ok()) {
        out = std::move(store);
    }
    return status;
}

} // namespace resolution
} // namespace arbiter
