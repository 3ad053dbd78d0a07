#pragma once

#include "config_store.hpp"
#include "crypto.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

class ApiKeyStore {
public:
    explicit ApiKeyStore(std::shared_ptr<ConfigStore> store);

    // Adopt persisted state; keys are kept in their stored form
    void load(const ApiKeyMap& keys, const EncryptionState& encryption);

    // Derive the cipher from a password. Plaintext keys already held are
    // re-encrypted and flushed.
    void enable_encryption(const std::string& password);
    bool encryption_enabled() const;

    void set(const std::string& provider, const std::string& secret);
    std::optional<std::string> get(const std::string& provider) const;
    void remove(const std::string& provider);

    // provider -> masked secret, for display
    std::map<std::string, std::string> masked() const;
    size_t size() const;

private:
    std::shared_ptr<ConfigStore> store_;
    mutable std::mutex mutex_;
    ApiKeyMap keys_;
    EncryptionState encryption_;
    std::unique_ptr<EncryptionManager> cipher_;

    std::string reveal_locked(const std::string& stored) const;
    void flush_locked();
};
