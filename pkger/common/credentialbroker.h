/* credentialbroker.h - Elevation secrets for privileged operations
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * A Credential lives only in process memory, is never logged and never
 * written to disk. Its bytes are zeroed on release(), on destruction, and
 * when they are moved out of.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _CREDENTIALBROKER_H_
#define _CREDENTIALBROKER_H_

#include "pkgtypes.h"
#include "processrunner.h"

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <optional>

namespace Pkger {

// ============================================================================
// Credential
// ============================================================================

/**
 * Credential - An elevation secret owned by one session
 *
 * Move-only. The moved-from object is left empty and released. Copies
 * would leave unzeroed bytes behind, so there are none.
 */
class Credential {
public:
    Credential() = default;

    // Takes the secret and wipes the caller's buffer
    explicit Credential(std::string&& secret);

    /**
     * Copy len bytes from data. The caller stays responsible for wiping
     * its own buffer (getpass() results, for example).
     */
    Credential(const char* data, size_t len);

    // Zeroes the bytes
    ~Credential();

    Credential(const Credential&) = delete;
    Credential& operator=(const Credential&) = delete;
    Credential(Credential&& other) noexcept;
    Credential& operator=(Credential&& other) noexcept;

    bool empty() const { return _bytes.empty(); }
    size_t size() const { return _bytes.size(); }

    // Zero the secret; reveal() returns an empty view afterwards
    void release();
    bool isReleased() const { return _released; }

    /**
     * View of the secret bytes for writing to a child's stdin.
     *
     * The view dangles after release() or a move; hand it to a
     * CommandSpec only together with an onInputWritten hook or a
     * ScopedCredential that outlives the command.
     */
    std::string_view reveal() const;

private:
    std::vector<char> _bytes;
    bool _released = false;
};

/**
 * ScopedCredential - Releases a credential on every exit path
 */
class ScopedCredential {
public:
    explicit ScopedCredential(Credential& credential) : _credential(credential) {}
    ~ScopedCredential() { _credential.release(); }

    ScopedCredential(const ScopedCredential&) = delete;
    ScopedCredential& operator=(const ScopedCredential&) = delete;

    Credential& get() { return _credential; }

private:
    Credential& _credential;
};

// ============================================================================
// Broker
// ============================================================================

/**
 * Synchronous prompt installed by the presentation layer. Returning
 * std::nullopt (or an empty credential) means the user declined.
 */
using CredentialPrompt = std::function<std::optional<Credential>(const std::string& prompt)>;

/**
 * CredentialBroker - Obtains elevation secrets from the presentation layer
 *
 * With a prompt callback installed, acquire() calls it directly on the
 * session thread. Without one, acquire() registers a pending request under
 * the session handle, invokes onWaiting (the orchestrator turns that into
 * a CredentialRequest event) and blocks until supply(), deny(), abort() or
 * cancellation of the token.
 */
class CredentialBroker {
public:
    struct AcquireResult {
        OperationResult result;
        Credential credential;
    };

    /**
     * Install (or clear, with an empty function) the synchronous prompt.
     * Must not be changed while a session is waiting in acquire().
     */
    void setPromptCallback(CredentialPrompt prompt);
    bool hasPromptCallback() const;

    /**
     * Obtain a credential for a session.
     *
     * @param handle     Session the request belongs to
     * @param prompt     Text shown to the user
     * @param cancel     Cancellation token of the session; honoured while waiting
     * @param onWaiting  Called once the asynchronous request is registered
     * @return Credential on success; CREDENTIAL_DENIED when declined or
     *         empty, CANCELLED when the session was cancelled or aborted
     */
    AcquireResult acquire(uint64_t handle,
                          const std::string& prompt,
                          const CancelToken& cancel,
                          const std::function<void()>& onWaiting = nullptr);

    // Answer a pending request; false if nothing is waiting under handle
    bool supply(uint64_t handle, std::string secret);
    bool deny(uint64_t handle);

    // Wake a waiting acquire() for a cancelled session
    void abort(uint64_t handle);

    bool isPending(uint64_t handle) const;

    // Zero a credential obtained from acquire()
    static void release(Credential& credential) { credential.release(); }

private:
    struct PendingRequest {
        bool answered = false;
        bool denied = false;
        bool aborted = false;
        Credential credential;
    };

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    CredentialPrompt _prompt;
    std::map<uint64_t, PendingRequest> _pending;
};

} // namespace Pkger

#endif // _CREDENTIALBROKER_H_

// vim:ts=4:sw=4:et
