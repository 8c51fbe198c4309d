/* configuration.h - Runtime configuration for the PKGER backend
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Settings are stored as key=value lines in
 *   $XDG_CONFIG_HOME/pkger/pkger.conf  (default ~/.config/pkger/pkger.conf)
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _CONFIGURATION_H_
#define _CONFIGURATION_H_

#include "structuredlog.h"

#include <string>
#include <map>

namespace Pkger {

/**
 * ElevationMode - How privileged commands are launched
 *
 *   SUDO    the password is fed to "sudo -S" (needs a credential)
 *   PKEXEC  polkit asks the user itself (no credential held by us)
 *   NONE    commands run as-is (already root)
 */
enum class ElevationMode {
    SUDO,
    PKEXEC,
    NONE
};

const char* elevationModeToString(ElevationMode mode);

/**
 * MutationPolicy - What happens to a mutating request while another one
 * holds the write lock
 */
enum class MutationPolicy {
    QUEUE,
    REJECT
};

const char* mutationPolicyToString(MutationPolicy policy);

struct Configuration {
    // External tools
    std::string pacmanPath = "pacman";
    std::string aurHelperPath = "yay";
    std::string pactreePath = "pactree";
    std::string sudoPath = "sudo";
    std::string pkexecPath = "pkexec";

    ElevationMode elevation = ElevationMode::SUDO;
    bool aurEnabled = true;             // Query/install AUR packages via the helper
    bool aurUpdates = true;             // Update-all goes through the helper

    MutationPolicy mutationPolicy = MutationPolicy::QUEUE;
    int credentialAttempts = 3;         // Password tries before giving up

    // Timing
    int stalenessSeconds = 600;         // Background auto-refresh threshold
    int cancelGraceMs = 5000;           // SIGTERM -> SIGKILL delay
    int queryTimeoutSeconds = 30;       // Informational queries
    int operationTimeoutSeconds = 0;    // Mutating commands (0 = unlimited)

    int outputTailLines = 20;
    int workerThreads = 2;

    // Logging
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;                // Empty = no file sink

    /**
     * Apply one key/value pair. Unknown keys and unparsable values are
     * ignored (and logged at WARN).
     *
     * @return true if the key was recognised and the value accepted
     */
    bool set(const std::string& key, const std::string& value);

    // Serialise all settings as key -> value
    std::map<std::string, std::string> toMap() const;

    /**
     * Load settings from a file on top of the current values.
     *
     * @param path Config file, empty for the default location
     * @return false if the file does not exist or cannot be read
     */
    bool load(const std::string& path = "");

    /**
     * Write all settings to a file, creating the directory if needed.
     */
    bool save(const std::string& path = "") const;

    // Apply logLevel and logFile to the global Logger
    void applyLogging() const;

    static std::string getConfigDir();
    static std::string getDefaultPath();
};

} // namespace Pkger

#endif // _CONFIGURATION_H_

// vim:ts=4:sw=4:et
