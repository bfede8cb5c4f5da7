#include <catch2/catch_test_macros.hpp>

#include "infrastructure/crypto/SecureStorage.hpp"

#include <filesystem>

using vlanvision::infra::SecureStorage;

namespace {

class TempKeyDir {
public:
    TempKeyDir() : dir_(std::filesystem::temp_directory_path() / "vlanvision_key_test") {
        std::filesystem::remove_all(dir_);
    }
    ~TempKeyDir() { std::filesystem::remove_all(dir_); }

    std::filesystem::path keyPath() const { return dir_ / ".key"; }

private:
    std::filesystem::path dir_;
};

} // namespace

TEST_CASE("SecureStorage encryption", "[SecureStorage]") {
    TempKeyDir dir;
    SecureStorage storage(dir.keyPath());
    REQUIRE(storage.isReady());
    REQUIRE(std::filesystem::exists(dir.keyPath()));

    SECTION("Round trip") {
        auto encrypted = storage.encrypt("community-string");
        REQUIRE(encrypted.has_value());
        REQUIRE(*encrypted != "community-string");
        REQUIRE(storage.decrypt(*encrypted) == "community-string");
    }

    SECTION("Each encryption uses a fresh nonce") {
        REQUIRE(*storage.encrypt("public") != *storage.encrypt("public"));
    }

    SECTION("Empty plaintext") {
        auto encrypted = storage.encrypt("");
        REQUIRE(storage.decrypt(*encrypted) == "");
    }

    SECTION("Key is reused by a second instance") {
        auto encrypted = storage.encrypt("shared");
        SecureStorage second(dir.keyPath());
        REQUIRE(second.decrypt(*encrypted) == "shared");
    }

    SECTION("Tampered or foreign values are rejected") {
        auto encrypted = *storage.encrypt("private");
        encrypted[encrypted.size() / 2] = encrypted[encrypted.size() / 2] == 'A' ? 'B' : 'A';
        REQUIRE_FALSE(storage.decrypt(encrypted).has_value());
        REQUIRE_FALSE(storage.decrypt("not base64 !!").has_value());
        REQUIRE_FALSE(storage.decrypt("c2hvcnQ=").has_value());
    }

    SECTION("Owner-only key file") {
        auto perms = std::filesystem::status(dir.keyPath()).permissions();
        REQUIRE((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
                std::filesystem::perms::none);
    }
}

TEST_CASE("SecureStorage base64", "[SecureStorage]") {
    REQUIRE(SecureStorage::base64Encode({'M', 'a', 'n'}) == "TWFu");
    REQUIRE(SecureStorage::base64Encode({}).empty());
    REQUIRE(SecureStorage::base64Decode("TWE=") == std::vector<unsigned char>{'M', 'a'});
    REQUIRE_FALSE(SecureStorage::base64Decode("T*W").has_value());
}
