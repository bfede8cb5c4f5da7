#include "infrastructure/crypto/SecureStorage.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <fstream>

namespace vlanvision::infra {

namespace {

constexpr size_t KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t MAC_SIZE = crypto_secretbox_MACBYTES;

} // namespace

SecureStorage::SecureStorage(const std::filesystem::path& keyPath) : keyPath_(keyPath) {
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium, secrets cannot be stored");
        return;
    }

    key_.resize(KEY_SIZE);
    ready_ = loadKey() || generateKey();
}

SecureStorage::~SecureStorage() {
    if (!key_.empty()) {
        sodium_memzero(key_.data(), key_.size());
    }
}

bool SecureStorage::loadKey() {
    std::error_code ec;
    if (!std::filesystem::exists(keyPath_, ec)) {
        return false;
    }

    std::ifstream file(keyPath_, std::ios::binary);
    if (file) {
        file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
        if (file.gcount() == static_cast<std::streamsize>(KEY_SIZE)) {
            spdlog::debug("Loaded secret key from {}", keyPath_.string());
            return true;
        }
    }
    spdlog::warn("Secret key at {} is unreadable, generating a new one", keyPath_.string());
    return false;
}

bool SecureStorage::generateKey() {
    randombytes_buf(key_.data(), KEY_SIZE);

    std::error_code ec;
    auto parent = keyPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to create key file: {}", keyPath_.string());
        return false;
    }
    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    file.close();

    std::filesystem::permissions(keyPath_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions on {}: {}", keyPath_.string(), ec.message());
    }

    spdlog::info("Generated new secret key at {}", keyPath_.string());
    return true;
}

std::optional<std::string> SecureStorage::encrypt(const std::string& plaintext) const {
    if (!ready_) {
        return std::nullopt;
    }

    std::vector<unsigned char> sealed(NONCE_SIZE + plaintext.size() + MAC_SIZE);
    unsigned char* nonce = sealed.data();
    randombytes_buf(nonce, NONCE_SIZE);

    if (crypto_secretbox_easy(sealed.data() + NONCE_SIZE, reinterpret_cast<const unsigned char*>(plaintext.data()),
                              plaintext.size(), nonce, key_.data()) != 0) {
        spdlog::error("Encryption failed");
        return std::nullopt;
    }
    return base64Encode(sealed);
}

std::optional<std::string> SecureStorage::decrypt(const std::string& encoded) const {
    if (!ready_) {
        return std::nullopt;
    }

    auto sealed = base64Decode(encoded);
    if (!sealed || sealed->size() < NONCE_SIZE + MAC_SIZE) {
        spdlog::warn("Encrypted value is not valid base64 or too short");
        return std::nullopt;
    }

    const unsigned char* nonce = sealed->data();
    const unsigned char* box = sealed->data() + NONCE_SIZE;
    size_t boxSize = sealed->size() - NONCE_SIZE;

    std::string plaintext(boxSize - MAC_SIZE, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()), box, boxSize, nonce,
                                   key_.data()) != 0) {
        spdlog::warn("Decryption failed: wrong key or tampered value");
        return std::nullopt;
    }
    return plaintext;
}

std::string SecureStorage::base64Encode(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return {};
    }

    size_t encodedLen = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encodedLen, '\0');
    sodium_bin2base64(encoded.data(), encodedLen, data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);

    // encoded_len counts the terminator
    while (!encoded.empty() && encoded.back() == '\0') {
        encoded.pop_back();
    }
    return encoded;
}

std::optional<std::vector<unsigned char>> SecureStorage::base64Decode(const std::string& encoded) {
    std::vector<unsigned char> decoded(encoded.size());
    size_t decodedLen = 0;

    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.c_str(), encoded.size(), nullptr, &decodedLen,
                          nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    decoded.resize(decodedLen);
    return decoded;
}

} // namespace vlanvision::infra
