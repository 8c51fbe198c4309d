/* credentialbroker.cc - Elevation secrets for privileged operations
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "credentialbroker.h"
#include "structuredlog.h"

#include <cstring>
#include <chrono>

namespace Pkger {

namespace {

void wipe(char* data, size_t len)
{
    if (data && len > 0) {
        explicit_bzero(data, len);
    }
}

} // namespace

// ============================================================================
// Credential
// ============================================================================

Credential::Credential(std::string&& secret)
    : _bytes(secret.begin(), secret.end())
{
    wipe(secret.data(), secret.size());
    secret.clear();
}

Credential::Credential(const char* data, size_t len)
    : _bytes(data, data + len)
{
}

Credential::~Credential()
{
    release();
}

Credential::Credential(Credential&& other) noexcept
    : _bytes(std::move(other._bytes))
    , _released(other._released)
{
    other._bytes.clear();
    other._released = true;
}

Credential& Credential::operator=(Credential&& other) noexcept
{
    if (this != &other) {
        release();
        _bytes = std::move(other._bytes);
        _released = other._released;
        other._bytes.clear();
        other._released = true;
    }
    return *this;
}

void Credential::release()
{
    wipe(_bytes.data(), _bytes.size());
    _bytes.clear();
    _bytes.shrink_to_fit();
    _released = true;
}

std::string_view Credential::reveal() const
{
    if (_released || _bytes.empty()) {
        return std::string_view();
    }
    return std::string_view(_bytes.data(), _bytes.size());
}

// ============================================================================
// Broker
// ============================================================================

void CredentialBroker::setPromptCallback(CredentialPrompt prompt)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _prompt = std::move(prompt);
}

bool CredentialBroker::hasPromptCallback() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<bool>(_prompt);
}

CredentialBroker::AcquireResult CredentialBroker::acquire(
    uint64_t handle,
    const std::string& prompt,
    const CancelToken& cancel,
    const std::function<void()>& onWaiting)
{
    AcquireResult acquired;

    CredentialPrompt promptCallback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        promptCallback = _prompt;
    }

    LOG(LogLevel::INFO)
        .component("Credentials")
        .session(handle)
        .message("Credential requested")
        .emit();

    // Synchronous mode
    if (promptCallback) {
        std::optional<Credential> answer = promptCallback(prompt);
        if (cancel.isCancelled()) {
            acquired.result = OperationResult::Failure(
                ErrorKind::CANCELLED, "Operation cancelled while waiting for authentication");
            return acquired;
        }
        if (!answer || answer->empty()) {
            acquired.result = OperationResult::Failure(
                ErrorKind::CREDENTIAL_DENIED, "Authentication was declined");
            return acquired;
        }
        acquired.credential = std::move(*answer);
        acquired.result = OperationResult::Success("Credential supplied");
        return acquired;
    }

    // Asynchronous mode
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _pending[handle] = PendingRequest();
    }

    if (onWaiting) {
        onWaiting();
    }

    std::unique_lock<std::mutex> lock(_mutex);
    while (true) {
        auto it = _pending.find(handle);
        if (it == _pending.end()) {
            acquired.result = OperationResult::Failure(
                ErrorKind::CANCELLED, "Credential request withdrawn");
            return acquired;
        }

        PendingRequest& pending = it->second;
        if (pending.aborted || cancel.isCancelled()) {
            _pending.erase(it);
            acquired.result = OperationResult::Failure(
                ErrorKind::CANCELLED, "Operation cancelled while waiting for authentication");
            return acquired;
        }
        if (pending.answered) {
            if (pending.denied || pending.credential.empty()) {
                _pending.erase(it);
                acquired.result = OperationResult::Failure(
                    ErrorKind::CREDENTIAL_DENIED, "Authentication was declined");
                return acquired;
            }
            acquired.credential = std::move(pending.credential);
            _pending.erase(it);
            acquired.result = OperationResult::Success("Credential supplied");
            return acquired;
        }

        // Wake periodically to notice a cancelled token
        _cv.wait_for(lock, std::chrono::milliseconds(100));
    }
}

bool CredentialBroker::supply(uint64_t handle, std::string secret)
{
    Credential credential(std::move(secret));

    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _pending.find(handle);
    if (it == _pending.end() || it->second.answered) {
        return false;
    }
    it->second.credential = std::move(credential);
    it->second.answered = true;
    _cv.notify_all();

    LOG(LogLevel::DEBUG)
        .component("Credentials")
        .session(handle)
        .message("Credential supplied")
        .emit();
    return true;
}

bool CredentialBroker::deny(uint64_t handle)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _pending.find(handle);
    if (it == _pending.end() || it->second.answered) {
        return false;
    }
    it->second.answered = true;
    it->second.denied = true;
    _cv.notify_all();

    LOG(LogLevel::INFO)
        .component("Credentials")
        .session(handle)
        .message("Credential request declined")
        .emit();
    return true;
}

void CredentialBroker::abort(uint64_t handle)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _pending.find(handle);
    if (it != _pending.end()) {
        it->second.aborted = true;
    }
    _cv.notify_all();
}

bool CredentialBroker::isPending(uint64_t handle) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _pending.find(handle);
    return it != _pending.end() && !it->second.answered;
}

} // namespace Pkger

// vim:ts=4:sw=4:et
