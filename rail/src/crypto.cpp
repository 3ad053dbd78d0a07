#include "crypto.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <memory>

namespace crypto {

namespace {

constexpr int PBKDF2_ITERS = 100000;
constexpr size_t KEY_LEN = 32;
constexpr size_t IV_LEN = 16;
constexpr size_t HMAC_LEN = 32;
constexpr uint8_t FERNET_VERSION = 0x80;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

std::vector<uint8_t> hmac_sha256(const uint8_t* key, size_t key_len,
                                 const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out(HMAC_LEN);
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha256(), key, static_cast<int>(key_len),
              data.data(), data.size(), out.data(), &out_len) || out_len != HMAC_LEN) {
        throw RailError(ErrorCode::EncryptionFailed, "HMAC computation failed");
    }
    return out;
}

std::vector<uint8_t> aes128_cbc(bool encrypt, const uint8_t* key, const uint8_t* iv,
                                const uint8_t* input, size_t input_len) {
    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw RailError(ErrorCode::EncryptionFailed, "EVP_CIPHER_CTX_new failed");
    }

    if (1 != EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key, iv, encrypt ? 1 : 0)) {
        throw RailError(ErrorCode::EncryptionFailed, "CipherInit failed");
    }

    std::vector<uint8_t> out(input_len + IV_LEN);
    int outl = 0;
    if (input_len > 0 &&
        1 != EVP_CipherUpdate(ctx.get(), out.data(), &outl, input, static_cast<int>(input_len))) {
        throw RailError(ErrorCode::EncryptionFailed, "CipherUpdate failed");
    }
    int tmplen = 0;
    if (1 != EVP_CipherFinal_ex(ctx.get(), out.data() + outl, &tmplen)) {
        throw RailError(ErrorCode::EncryptionFailed, "CipherFinal failed (bad padding)");
    }
    out.resize(static_cast<size_t>(outl + tmplen));
    return out;
}

void put_u64_be(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xffu));
    }
}

} // namespace

std::vector<uint8_t> generate_salt(size_t length) {
    std::vector<uint8_t> salt(length);
    if (1 != RAND_bytes(salt.data(), static_cast<int>(salt.size()))) {
        throw RailError(ErrorCode::EncryptionFailed, "RAND_bytes failed");
    }
    return salt;
}

std::vector<uint8_t> derive_key(const std::string& password, const std::vector<uint8_t>& salt) {
    if (password.empty()) {
        throw RailError(ErrorCode::EncryptionFailed, "Empty encryption password");
    }
    std::vector<uint8_t> key(KEY_LEN);
    if (1 != PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()),
                               salt.data(), static_cast<int>(salt.size()), PBKDF2_ITERS,
                               EVP_sha256(), static_cast<int>(key.size()), key.data())) {
        throw RailError(ErrorCode::EncryptionFailed, "PBKDF2 failed");
    }
    return key;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    std::string input = util::trim(text);
    if (input.size() % 4 != 0) {
        throw RailError(ErrorCode::EncryptionFailed, "Invalid base64 length");
    }
    if (input.empty()) {
        return {};
    }

    std::vector<uint8_t> out(3 * input.size() / 4);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (written < 0) {
        throw RailError(ErrorCode::EncryptionFailed, "Invalid base64 data");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string out = base64_encode(data);
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::vector<uint8_t> base64url_decode(const std::string& text) {
    std::string input = util::trim(text);
    std::replace(input.begin(), input.end(), '-', '+');
    std::replace(input.begin(), input.end(), '_', '/');
    while (input.size() % 4 != 0) input += '=';
    return base64_decode(input);
}

std::string fernet_encrypt(const std::string& plaintext, const std::vector<uint8_t>& key) {
    if (key.size() != KEY_LEN) {
        throw RailError(ErrorCode::EncryptionFailed, "Fernet key must be 32 bytes");
    }
    const uint8_t* signing_key = key.data();
    const uint8_t* encryption_key = key.data() + 16;

    std::vector<uint8_t> iv = generate_salt(IV_LEN);
    auto ciphertext = aes128_cbc(true, encryption_key, iv.data(),
                                 reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size());

    std::vector<uint8_t> token;
    token.reserve(1 + 8 + IV_LEN + ciphertext.size() + HMAC_LEN);
    token.push_back(FERNET_VERSION);
    put_u64_be(token, static_cast<uint64_t>(util::current_unix_seconds()));
    token.insert(token.end(), iv.begin(), iv.end());
    token.insert(token.end(), ciphertext.begin(), ciphertext.end());

    auto mac = hmac_sha256(signing_key, 16, token);
    token.insert(token.end(), mac.begin(), mac.end());

    return base64url_encode(token);
}

std::string fernet_decrypt(const std::string& token, const std::vector<uint8_t>& key) {
    if (key.size() != KEY_LEN) {
        throw RailError(ErrorCode::EncryptionFailed, "Fernet key must be 32 bytes");
    }

    auto raw = base64url_decode(token);
    if (raw.size() < 1 + 8 + IV_LEN + 16 + HMAC_LEN || raw[0] != FERNET_VERSION) {
        throw RailError(ErrorCode::EncryptionFailed, "Malformed Fernet token");
    }

    std::vector<uint8_t> signed_part(raw.begin(), raw.end() - HMAC_LEN);
    auto expected = hmac_sha256(key.data(), 16, signed_part);
    if (CRYPTO_memcmp(expected.data(), raw.data() + signed_part.size(), HMAC_LEN) != 0) {
        throw RailError(ErrorCode::EncryptionFailed,
                        "Decryption failed (wrong password or corrupted data)");
    }

    const uint8_t* iv = raw.data() + 9;
    const uint8_t* body = iv + IV_LEN;
    size_t body_len = signed_part.size() - 9 - IV_LEN;
    auto plaintext = aes128_cbc(false, key.data() + 16, iv, body, body_len);
    return std::string(plaintext.begin(), plaintext.end());
}

} // namespace crypto

EncryptionManager::EncryptionManager(const std::string& password, std::vector<uint8_t> salt)
    : salt_(salt.empty() ? crypto::generate_salt() : std::move(salt))
    , key_(crypto::derive_key(password, salt_))
{}

std::string EncryptionManager::encrypt(const std::string& plaintext) const {
    std::string token = crypto::fernet_encrypt(plaintext, key_);
    return crypto::base64_encode(std::vector<uint8_t>(token.begin(), token.end()));
}

std::string EncryptionManager::decrypt(const std::string& ciphertext) const {
    auto token = crypto::base64_decode(ciphertext);
    return crypto::fernet_decrypt(std::string(token.begin(), token.end()), key_);
}

std::string EncryptionManager::salt_base64() const {
    return crypto::base64_encode(salt_);
}
