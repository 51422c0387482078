#pragma once

#include <openssl/crypto.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

/// Cleanses the whole capacity of a string and empties it. A moved-from
/// short string keeps its old characters in the inline buffer after
/// size() drops to zero, so size() alone is not enough.
inline void secure_wipe(std::string& value) {
    value.resize(value.capacity());
    OPENSSL_cleanse(value.data(), value.size());
    value.clear();
}

/**
 * @brief Move-only byte buffer overwritten with OPENSSL_cleanse on destruction
 *
 * Holds derived key material and decrypted plaintext. Copies are deleted so
 * the bytes exist in exactly one place until wiped.
 */
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(size_t size) : data_(size, 0) {}
    SecureBytes(const uint8_t* data, size_t size) : data_(data, data + size) {}
    ~SecureBytes() { wipe(); }

    SecureBytes(SecureBytes&& other) noexcept : data_(std::move(other.data_)) {
        other.data_.clear();
    }
    SecureBytes& operator=(SecureBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            data_ = std::move(other.data_);
            other.data_.clear();
        }
        return *this;
    }

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    [[nodiscard]] uint8_t* data() { return data_.data(); }
    [[nodiscard]] const uint8_t* data() const { return data_.data(); }
    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool empty() const { return data_.empty(); }

    void resize(size_t n) {
        // shrinking must not leave key bytes in the dropped tail
        if (n < data_.size()) {
            OPENSSL_cleanse(data_.data() + n, data_.size() - n);
        }
        data_.resize(n, 0);
    }

    void wipe() {
        if (!data_.empty()) {
            OPENSSL_cleanse(data_.data(), data_.size());
            data_.clear();
        }
    }

private:
    std::vector<uint8_t> data_;
};

/**
 * @brief Move-only string for plaintext secrets, wiped on destruction
 */
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string value) : value_(std::move(value)) {}
    SecureString(const char* data, size_t size) : value_(data, size) {}
    ~SecureString() { wipe(); }

    SecureString(SecureString&& other) noexcept : value_(std::move(other.value_)) {
        other.wipe();
    }
    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            wipe();
            value_ = std::move(other.value_);
            other.wipe();
        }
        return *this;
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    [[nodiscard]] std::string_view view() const { return value_; }
    [[nodiscard]] size_t size() const { return value_.size(); }
    [[nodiscard]] bool empty() const { return value_.empty(); }

    void wipe() { secure_wipe(value_); }

private:
    std::string value_;
};

} // namespace llmshield
