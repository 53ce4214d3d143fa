#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace triage {

inline constexpr auto kCacheTtl = std::chrono::minutes(5);
inline constexpr auto kPollInterval = std::chrono::seconds(1);
inline constexpr int kAutoRefreshTicks = 60;
inline constexpr std::size_t kSubscriberCapacity = 10;
inline constexpr std::size_t kMaxAutomationPayloadBytes = 8192;
// Unwritten bytes a stream may hold before further events for it are dropped.
inline constexpr std::int64_t kMaxStreamBacklogBytes = 256 * 1024;
// Declared for a batched flush that persistence does not use; every write is synchronous.
inline constexpr auto kPersistInterval = std::chrono::seconds(10);

inline constexpr const char *kDatabaseFileName = "triage.db";
inline constexpr const char *kLegacyStateFileName = "triage.state.json";
inline constexpr const char *kLegacyBackupSuffix = ".bak";

// Runtime settings resolved from the environment once at startup.
struct DaemonConfig {
    std::string dataDir;
    std::string registryFile;
    std::string socketName;
    std::string executorProgram;
    std::vector<std::string> executorArgs;
    bool traceEnabled = false;

    std::string databasePath() const;
    std::string legacyStatePath() const;
    std::string logsDir() const;
};

DaemonConfig loadConfigFromEnvironment();

} // namespace triage
