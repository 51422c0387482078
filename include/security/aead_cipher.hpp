#pragma once

#include "core/secure_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace llmshield {

/**
 * @brief AES-256-GCM with a fresh 96-bit random nonce per call and a 128-bit tag
 *
 * The AAD is authenticated but not encrypted; decrypting with a different
 * AAD fails exactly like a tampered ciphertext.
 */
class AeadCipher {
public:
    static constexpr size_t kKeyLen = 32;
    static constexpr size_t kIvLen = 12;
    static constexpr size_t kTagLen = 16;

    struct Sealed {
        std::vector<uint8_t> ciphertext;
        std::vector<uint8_t> iv;
        std::vector<uint8_t> tag;
    };

    /**
     * @throws std::invalid_argument on a key that is not kKeyLen bytes
     * @throws std::runtime_error if the random source or cipher fails
     */
    [[nodiscard]] static Sealed encrypt(const SecureBytes& key,
                                        std::string_view plaintext,
                                        std::string_view aad);

    /**
     * @throws DecryptionIntegrityError on tag mismatch or malformed IV/tag
     */
    [[nodiscard]] static SecureString decrypt(const SecureBytes& key,
                                              const Sealed& sealed,
                                              std::string_view aad);
};

} // namespace llmshield
