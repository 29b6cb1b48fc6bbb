/**
 * @file crypto_mode.h
 * @brief XSalsa20-Poly1305 voice packet encryption in the three Discord nonce variants.
 * @details Packets are laid out as `[header | tag(16) | ciphertext | nonce suffix]`.
 *          The nonce suffix is empty for `NORMAL` (nonce taken from the header),
 *          24 random bytes for `SUFFIX`, and a 4-byte big-endian counter for `LITE`.
 */
#ifndef VOICELINK_CRYPTO_MODE_H
#define VOICELINK_CRYPTO_MODE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voicelink {
namespace voice {

/**
 * @enum CryptoMode
 * @brief Encryption variants negotiated with the voice gateway.
 */
enum class CryptoMode {
    NORMAL, ///< `xsalsa20_poly1305`: nonce is the packet header, zero padded.
    SUFFIX, ///< `xsalsa20_poly1305_suffix`: random nonce appended to the packet.
    LITE    ///< `xsalsa20_poly1305_lite`: 32-bit counter appended to the packet.
};

constexpr std::size_t CRYPTO_KEY_SIZE = 32;
constexpr std::size_t CRYPTO_NONCE_SIZE = 24;
constexpr std::size_t CRYPTO_TAG_SIZE = 16;

/** @brief Gateway name of a crypto mode. */
const char* crypto_mode_name(CryptoMode mode);

/** @brief Parses a gateway mode name. */
std::optional<CryptoMode> crypto_mode_from_name(const std::string& name);

/** @brief Bytes preceding the encrypted body within the RTP payload. */
inline std::size_t crypto_payload_prefix_len(CryptoMode) { return CRYPTO_TAG_SIZE; }

/** @brief Bytes of nonce material appended after the encrypted body. */
std::size_t crypto_payload_suffix_len(CryptoMode mode);

/**
 * @class VoiceCipher
 * @brief Immutable session key established by SessionDescription.
 * @details Shared read-only between the mixer and the receive path for the lifetime of
 *          a connection.
 */
class VoiceCipher {
public:
    /**
     * @brief Builds a cipher from the gateway's `secret_key`.
     * @throws std::runtime_error if libsodium cannot initialise or the key is not 32 bytes.
     */
    explicit VoiceCipher(const std::vector<uint8_t>& secret_key);

    /**
     * @brief Encrypts `payload_len` bytes following the tag space, in place.
     * @param mode Nonce variant.
     * @param packet Start of the packet (header first).
     * @param header_len Length of the unencrypted header.
     * @param payload_len Length of the plaintext located at `header_len + CRYPTO_TAG_SIZE`.
     * @param capacity Total writable bytes at `packet`.
     * @param lite_nonce Counter used (then incremented) by `LITE` mode.
     * @param out_len Final packet length including any nonce suffix.
     * @return false if the packet does not fit or encryption failed.
     */
    bool encrypt_in_place(CryptoMode mode,
                          uint8_t* packet,
                          std::size_t header_len,
                          std::size_t payload_len,
                          std::size_t capacity,
                          uint32_t& lite_nonce,
                          std::size_t& out_len) const;

    /**
     * @brief Authenticates and decrypts a received packet in place.
     * @param mode Nonce variant.
     * @param packet Start of the packet (header first).
     * @param header_len Length of the unencrypted header.
     * @param packet_len Total received length.
     * @param out_body_offset Offset of the plaintext from the start of the packet.
     * @param out_body_len Length of the plaintext.
     * @return false if the packet is too short or fails authentication.
     */
    bool decrypt_in_place(CryptoMode mode,
                          uint8_t* packet,
                          std::size_t header_len,
                          std::size_t packet_len,
                          std::size_t& out_body_offset,
                          std::size_t& out_body_len) const;

private:
    std::array<uint8_t, CRYPTO_KEY_SIZE> key_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_CRYPTO_MODE_H
