#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief Encrypts configuration secrets such as the SNMP community string.
 *
 * Uses libsodium's secretbox (XSalsa20-Poly1305) with a key kept in a file
 * beside the configuration. The key is generated on first use and written
 * with owner-only permissions.
 *
 * @note Non-copyable. Key material is zeroed on destruction.
 */
class SecureStorage {
public:
    explicit SecureStorage(const std::filesystem::path& keyPath);
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    /**
     * @brief Encrypts @p plaintext.
     * @return Base64 of nonce followed by ciphertext, or nullopt if no key is available.
     */
    std::optional<std::string> encrypt(const std::string& plaintext) const;

    /**
     * @brief Decrypts a value produced by encrypt().
     * @return Plaintext, or nullopt on a bad encoding, wrong key or tampered value.
     */
    std::optional<std::string> decrypt(const std::string& encoded) const;

    /// True once libsodium is initialized and a key was loaded or generated.
    [[nodiscard]] bool isReady() const { return ready_; }

    [[nodiscard]] const std::filesystem::path& keyPath() const { return keyPath_; }

    static std::string base64Encode(const std::vector<unsigned char>& data);
    static std::optional<std::vector<unsigned char>> base64Decode(const std::string& encoded);

private:
    bool loadKey();
    bool generateKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
    bool ready_{false};
};

} // namespace vlanvision::infra
