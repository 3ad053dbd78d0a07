#include "api_key_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

ApiKeyStore::ApiKeyStore(std::shared_ptr<ConfigStore> store)
    : store_(std::move(store))
{}

void ApiKeyStore::load(const ApiKeyMap& keys, const EncryptionState& encryption) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.clear();
    for (const auto& [provider, secret] : keys) {
        keys_[util::to_lower(provider)] = secret;
    }
    encryption_ = encryption;
    cipher_.reset();
}

void ApiKeyStore::enable_encryption(const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<uint8_t> salt;
    if (encryption_.enabled && !encryption_.salt.empty()) {
        salt = crypto::base64_decode(encryption_.salt);
    }
    auto cipher = std::make_unique<EncryptionManager>(password, salt);

    if (encryption_.enabled) {
        // Fail early on a wrong password rather than on first use
        for (const auto& [provider, stored] : keys_) {
            cipher->decrypt(stored);
        }
        cipher_ = std::move(cipher);
        spdlog::info("API key encryption unlocked for {} keys", keys_.size());
        return;
    }

    for (auto& [provider, stored] : keys_) {
        stored = cipher->encrypt(stored);
    }
    encryption_.enabled = true;
    encryption_.salt = cipher->salt_base64();
    cipher_ = std::move(cipher);

    spdlog::info("API key encryption enabled, {} existing keys encrypted", keys_.size());
    flush_locked();
}

bool ApiKeyStore::encryption_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return encryption_.enabled;
}

std::string ApiKeyStore::reveal_locked(const std::string& stored) const {
    if (!encryption_.enabled) {
        return stored;
    }
    if (!cipher_) {
        throw RailError(ErrorCode::EncryptionFailed,
                        "API keys are encrypted but no password was provided",
                        "Set RAIL_ENCRYPTION_KEY");
    }
    return cipher_->decrypt(stored);
}

void ApiKeyStore::set(const std::string& provider, const std::string& secret) {
    std::string name = util::to_lower(util::trim(provider));
    if (name.empty() || secret.empty()) {
        throw RailError(ErrorCode::InvalidInput, "Provider name and API key must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (encryption_.enabled) {
        if (!cipher_) {
            throw RailError(ErrorCode::EncryptionFailed,
                            "API keys are encrypted but no password was provided",
                            "Set RAIL_ENCRYPTION_KEY");
        }
        keys_[name] = cipher_->encrypt(secret);
    } else {
        keys_[name] = secret;
    }

    spdlog::info("API key set for {}", name);
    flush_locked();
}

std::optional<std::string> ApiKeyStore::get(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(util::to_lower(provider));
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return reveal_locked(it->second);
}

void ApiKeyStore::remove(const std::string& provider) {
    std::string name = util::to_lower(util::trim(provider));

    std::lock_guard<std::mutex> lock(mutex_);
    if (keys_.erase(name) == 0) {
        throw RailError(ErrorCode::NotConfigured,
                        fmt::format("API key for {} not found", name));
    }

    spdlog::info("API key removed for {}", name);
    flush_locked();
}

std::map<std::string, std::string> ApiKeyStore::masked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> out;
    for (const auto& [provider, stored] : keys_) {
        try {
            out[provider] = util::mask_secret(reveal_locked(stored));
        } catch (const RailError& e) {
            spdlog::warn("Cannot reveal API key for {}: {}", provider, e.what());
            out[provider] = "(encrypted)";
        }
    }
    return out;
}

size_t ApiKeyStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

void ApiKeyStore::flush_locked() {
    if (!store_) return;
    if (!store_->save_api_keys(keys_, encryption_)) {
        spdlog::warn("API key change kept in memory only; persisting to {} failed", store_->path());
    }
}
