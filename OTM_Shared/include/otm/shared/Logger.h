#pragma once

#include <string>

/*
 * OpenTower logging
 *
 * Standard Log Format:
 *   [YYYY-MM-DD HH:MM:SS] [ExecutableName] [LEVEL] [category] message
 *
 * Example:
 *   [2025-03-02 21:04:11] [OTM_CombatHost] [INFO] [combat] Player attack: player=Rich, npc=Cave Rat, roll=17, ac=11, hit=1
 *
 * Usage:
 *   1. Call initLogger("OTM_<Name>") in main()
 *   2. Optionally raise or lower the threshold with setLogLevel()
 *   3. Use logDebug/logInfo/logWarn/logError with a category
 *      ("combat", "aggro", "death", "respawn", "population", "world", "Config", "Main")
 *
 * Guidelines:
 *   - Per-attack detail goes to DEBUG, lifecycle transitions to INFO
 *   - Anomalies carry player/npc/room identifiers so a single fight can be traced
 */

namespace otm::shared {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

void initLogger(const std::string& appName);
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Accepts DEBUG/INFO/WARN/ERROR (case-insensitive); unknown names map to Info
LogLevel parseLogLevel(const std::string& name);

void logDebug(const std::string& category, const std::string& message);
void logInfo(const std::string& category, const std::string& message);
void logWarn(const std::string& category, const std::string& message);
void logError(const std::string& category, const std::string& message);

} // namespace otm::shared
