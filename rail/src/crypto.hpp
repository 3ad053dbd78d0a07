#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace crypto {

std::vector<uint8_t> generate_salt(size_t length = 16);

// PBKDF2-HMAC-SHA256, 100000 iterations, 32-byte key
std::vector<uint8_t> derive_key(const std::string& password, const std::vector<uint8_t>& salt);

std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& text);
std::string base64url_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64url_decode(const std::string& text);

// Fernet tokens (AES-128-CBC + HMAC-SHA256), interoperable with other
// Fernet implementations given the same 32-byte key
std::string fernet_encrypt(const std::string& plaintext, const std::vector<uint8_t>& key);
std::string fernet_decrypt(const std::string& token, const std::vector<uint8_t>& key);

} // namespace crypto

// Password-derived cipher for secrets at rest. Ciphertexts are standard
// base64 of the Fernet token.
class EncryptionManager {
public:
    explicit EncryptionManager(const std::string& password, std::vector<uint8_t> salt = {});

    std::string encrypt(const std::string& plaintext) const;
    std::string decrypt(const std::string& ciphertext) const;

    std::string salt_base64() const;

private:
    std::vector<uint8_t> salt_;
    std::vector<uint8_t> key_;
};
