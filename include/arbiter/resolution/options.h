// ARBITER - Protocol Options
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Deployment settings read from the configuration file. Durations and
// thresholds are compile-time constants (see params.h) and are not here.
//
//   [oracle]
//   manager=<40 hex chars>     (repeatable or comma separated)
//
//   [log]
//   level=info
//   file=/var/log/arbiter.log
//   console=true
//
//   [store]
//   enabled=true
//   path=/var/lib/arbiter/store

#ifndef ARBITER_RESOLUTION_OPTIONS_H
#define ARBITER_RESOLUTION_OPTIONS_H

#include <arbiter/core/types.h>
#include <arbiter/db/database.h>
#include <arbiter/util/config.h>
#include <arbiter/util/logging.h>

#include <memory>
#include <set>
#include <string>

namespace arbiter {
namespace resolution {

class ResolutionStore;

struct ProtocolOptions {
    /// Holders of the oracle-manager capability
    std::set<Address> managers;

    util::LogLevel logLevel{util::LogLevel::Info};
    std::string logFile;
    bool logToConsole{true};

    bool storeEnabled{false};
    std::string storePath;
};

/**
 * Read options from a parsed configuration.
 *
 * Malformed manager addresses, log levels or booleans are errors; unknown
 * keys are reported as warnings.
 */
util::ConfigParseResult LoadProtocolOptions(const util::ConfigManager& config,
                                            ProtocolOptions& options);

/// Install console and file sinks; false if the log file cannot be opened
bool ApplyLoggingOptions(const ProtocolOptions& options);

/**
 * Open the audit store when enabled. Leaves out empty when the store is
 * disabled.
 */
db::Status OpenConfiguredStore(const ProtocolOptions& options,
                               std::unique_ptr<ResolutionStore>& out);

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_OPTIONS_H
