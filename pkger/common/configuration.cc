/* configuration.cc - Runtime configuration for the PKGER backend
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "configuration.h"

#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace Pkger {

const char* elevationModeToString(ElevationMode mode)
{
    switch (mode) {
        case ElevationMode::SUDO:   return "sudo";
        case ElevationMode::PKEXEC: return "pkexec";
        case ElevationMode::NONE:   return "none";
    }
    return "sudo";
}

const char* mutationPolicyToString(MutationPolicy policy)
{
    switch (policy) {
        case MutationPolicy::QUEUE:  return "queue";
        case MutationPolicy::REJECT: return "reject";
    }
    return "queue";
}

namespace {

void trim(std::string& s)
{
    size_t start = s.find_first_not_of(" \t");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos || end == std::string::npos) {
        s.clear();
        return;
    }
    s = s.substr(start, end - start + 1);
}

bool parseBool(const std::string& value, bool& out)
{
    if (value == "true" || value == "1" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& value, int minValue, int& out)
{
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < minValue) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

// ============================================================================
// Key/Value Access
// ============================================================================

bool Configuration::set(const std::string& key, const std::string& value)
{
    bool ok = true;

    if (key == "pacman_path") {
        ok = !value.empty();
        if (ok) pacmanPath = value;
    } else if (key == "aur_helper_path") {
        ok = !value.empty();
        if (ok) aurHelperPath = value;
    } else if (key == "pactree_path") {
        ok = !value.empty();
        if (ok) pactreePath = value;
    } else if (key == "sudo_path") {
        ok = !value.empty();
        if (ok) sudoPath = value;
    } else if (key == "pkexec_path") {
        ok = !value.empty();
        if (ok) pkexecPath = value;
    } else if (key == "elevation") {
        if (value == "sudo") elevation = ElevationMode::SUDO;
        else if (value == "pkexec") elevation = ElevationMode::PKEXEC;
        else if (value == "none") elevation = ElevationMode::NONE;
        else ok = false;
    } else if (key == "aur_enabled") {
        ok = parseBool(value, aurEnabled);
    } else if (key == "aur_updates") {
        ok = parseBool(value, aurUpdates);
    } else if (key == "mutation_policy") {
        if (value == "queue") mutationPolicy = MutationPolicy::QUEUE;
        else if (value == "reject") mutationPolicy = MutationPolicy::REJECT;
        else ok = false;
    } else if (key == "credential_attempts") {
        ok = parseInt(value, 1, credentialAttempts);
    } else if (key == "staleness_seconds") {
        ok = parseInt(value, 0, stalenessSeconds);
    } else if (key == "cancel_grace_ms") {
        ok = parseInt(value, 0, cancelGraceMs);
    } else if (key == "query_timeout_seconds") {
        ok = parseInt(value, 1, queryTimeoutSeconds);
    } else if (key == "operation_timeout_seconds") {
        ok = parseInt(value, 0, operationTimeoutSeconds);
    } else if (key == "output_tail_lines") {
        ok = parseInt(value, 1, outputTailLines);
    } else if (key == "worker_threads") {
        ok = parseInt(value, 1, workerThreads);
    } else if (key == "log_level") {
        logLevel = logLevelFromString(value, logLevel);
    } else if (key == "log_file") {
        logFile = value;
    } else {
        LOG(LogLevel::WARN)
            .component("Config")
            .field("key", key)
            .message("Ignoring unknown configuration key")
            .emit();
        return false;
    }

    if (!ok) {
        LOG(LogLevel::WARN)
            .component("Config")
            .field("key", key)
            .field("value", value)
            .message("Ignoring invalid configuration value")
            .emit();
    }
    return ok;
}

std::map<std::string, std::string> Configuration::toMap() const
{
    std::map<std::string, std::string> values;
    values["pacman_path"] = pacmanPath;
    values["aur_helper_path"] = aurHelperPath;
    values["pactree_path"] = pactreePath;
    values["sudo_path"] = sudoPath;
    values["pkexec_path"] = pkexecPath;
    values["elevation"] = elevationModeToString(elevation);
    values["aur_enabled"] = aurEnabled ? "true" : "false";
    values["aur_updates"] = aurUpdates ? "true" : "false";
    values["mutation_policy"] = mutationPolicyToString(mutationPolicy);
    values["credential_attempts"] = std::to_string(credentialAttempts);
    values["staleness_seconds"] = std::to_string(stalenessSeconds);
    values["cancel_grace_ms"] = std::to_string(cancelGraceMs);
    values["query_timeout_seconds"] = std::to_string(queryTimeoutSeconds);
    values["operation_timeout_seconds"] = std::to_string(operationTimeoutSeconds);
    values["output_tail_lines"] = std::to_string(outputTailLines);
    values["worker_threads"] = std::to_string(workerThreads);
    values["log_level"] = logLevelToString(logLevel);
    values["log_file"] = logFile;
    return values;
}

// ============================================================================
// File I/O
// ============================================================================

std::string Configuration::getConfigDir()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/pkger";
    }

    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "";
    }
    return std::string(home) + "/.config/pkger";
}

std::string Configuration::getDefaultPath()
{
    return getConfigDir() + "/pkger.conf";
}

bool Configuration::load(const std::string& path)
{
    std::string configPath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(configPath);
    if (!file.is_open()) {
        return false;  // No config file, keep defaults
    }

    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);

        set(key, value);
    }

    LOG(LogLevel::DEBUG)
        .component("Config")
        .field("path", configPath)
        .message("Configuration loaded")
        .emit();
    return true;
}

bool Configuration::save(const std::string& path) const
{
    std::string configPath = path.empty() ? getDefaultPath() : path;

    std::error_code ec;
    auto parent = std::filesystem::path(configPath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG(LogLevel::WARN)
                .component("Config")
                .field("path", parent.string())
                .message("Cannot create configuration directory: " + ec.message())
                .emit();
            return false;
        }
    }

    std::ofstream file(configPath);
    if (!file.is_open()) {
        return false;
    }

    file << "# PKGER Configuration\n";
    file << "# Generated automatically\n\n";

    for (const auto& [key, value] : toMap()) {
        file << key << "=" << value << "\n";
    }
    return static_cast<bool>(file);
}

void Configuration::applyLogging() const
{
    Logger::instance().setMinLevel(logLevel);
    if (!logFile.empty() && !Logger::instance().addFileSink(logFile)) {
        LOG(LogLevel::WARN)
            .component("Config")
            .field("path", logFile)
            .message("Cannot open log file")
            .emit();
    }
}

} // namespace Pkger

// vim:ts=4:sw=4:et
