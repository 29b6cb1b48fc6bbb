#include "crypto_mode.h"
#include "../utils/cpp_logger.h"

#include <sodium.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace voicelink {
namespace voice {

namespace {
constexpr std::size_t kLiteNonceSize = 4;

void build_header_nonce(const uint8_t* packet, std::size_t header_len, uint8_t* nonce) {
    std::memset(nonce, 0, CRYPTO_NONCE_SIZE);
    std::memcpy(nonce, packet, std::min(header_len, CRYPTO_NONCE_SIZE));
}
} // namespace

const char* crypto_mode_name(CryptoMode mode) {
    switch (mode) {
        case CryptoMode::NORMAL: return "xsalsa20_poly1305";
        case CryptoMode::SUFFIX: return "xsalsa20_poly1305_suffix";
        case CryptoMode::LITE: return "xsalsa20_poly1305_lite";
    }
    return "xsalsa20_poly1305";
}

std::optional<CryptoMode> crypto_mode_from_name(const std::string& name) {
    for (CryptoMode mode : {CryptoMode::NORMAL, CryptoMode::SUFFIX, CryptoMode::LITE}) {
        if (name == crypto_mode_name(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

std::size_t crypto_payload_suffix_len(CryptoMode mode) {
    switch (mode) {
        case CryptoMode::NORMAL: return 0;
        case CryptoMode::SUFFIX: return CRYPTO_NONCE_SIZE;
        case CryptoMode::LITE: return kLiteNonceSize;
    }
    return 0;
}

VoiceCipher::VoiceCipher(const std::vector<uint8_t>& secret_key) {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialisation failed");
    }
    if (secret_key.size() != CRYPTO_KEY_SIZE) {
        throw std::runtime_error("voice secret key must be 32 bytes, got " + std::to_string(secret_key.size()));
    }
    std::copy(secret_key.begin(), secret_key.end(), key_.begin());
}

bool VoiceCipher::encrypt_in_place(CryptoMode mode,
                                   uint8_t* packet,
                                   std::size_t header_len,
                                   std::size_t payload_len,
                                   std::size_t capacity,
                                   uint32_t& lite_nonce,
                                   std::size_t& out_len) const {
    const std::size_t suffix_len = crypto_payload_suffix_len(mode);
    const std::size_t body_start = header_len + CRYPTO_TAG_SIZE;
    const std::size_t final_len = body_start + payload_len + suffix_len;
    if (final_len > capacity) {
        LOG_VL_ERROR("[VoiceCipher] Packet of %zu bytes exceeds buffer capacity %zu", final_len, capacity);
        return false;
    }

    uint8_t nonce[CRYPTO_NONCE_SIZE];
    uint8_t* suffix = packet + body_start + payload_len;
    switch (mode) {
        case CryptoMode::NORMAL:
            build_header_nonce(packet, header_len, nonce);
            break;
        case CryptoMode::SUFFIX:
            randombytes_buf(nonce, sizeof(nonce));
            std::memcpy(suffix, nonce, CRYPTO_NONCE_SIZE);
            break;
        case CryptoMode::LITE:
            std::memset(nonce, 0, sizeof(nonce));
            nonce[0] = static_cast<uint8_t>(lite_nonce >> 24);
            nonce[1] = static_cast<uint8_t>(lite_nonce >> 16);
            nonce[2] = static_cast<uint8_t>(lite_nonce >> 8);
            nonce[3] = static_cast<uint8_t>(lite_nonce);
            std::memcpy(suffix, nonce, kLiteNonceSize);
            ++lite_nonce;
            break;
    }

    uint8_t* body = packet + body_start;
    uint8_t* tag = packet + header_len;
    if (crypto_secretbox_detached(body, tag, body, payload_len, nonce, key_.data()) != 0) {
        LOG_VL_ERROR("[VoiceCipher] Encryption failed for %zu byte payload", payload_len);
        return false;
    }

    out_len = final_len;
    return true;
}

bool VoiceCipher::decrypt_in_place(CryptoMode mode,
                                   uint8_t* packet,
                                   std::size_t header_len,
                                   std::size_t packet_len,
                                   std::size_t& out_body_offset,
                                   std::size_t& out_body_len) const {
    const std::size_t suffix_len = crypto_payload_suffix_len(mode);
    if (packet_len < header_len + CRYPTO_TAG_SIZE + suffix_len) {
        return false;
    }

    uint8_t nonce[CRYPTO_NONCE_SIZE];
    const uint8_t* suffix = packet + packet_len - suffix_len;
    switch (mode) {
        case CryptoMode::NORMAL:
            build_header_nonce(packet, header_len, nonce);
            break;
        case CryptoMode::SUFFIX:
            std::memcpy(nonce, suffix, CRYPTO_NONCE_SIZE);
            break;
        case CryptoMode::LITE:
            std::memset(nonce, 0, sizeof(nonce));
            std::memcpy(nonce, suffix, kLiteNonceSize);
            break;
    }

    const std::size_t body_start = header_len + CRYPTO_TAG_SIZE;
    const std::size_t body_len = packet_len - body_start - suffix_len;
    uint8_t* body = packet + body_start;
    const uint8_t* tag = packet + header_len;
    if (crypto_secretbox_open_detached(body, body, tag, body_len, nonce, key_.data()) != 0) {
        return false;
    }

    out_body_offset = body_start;
    out_body_len = body_len;
    return true;
}

} // namespace voice
} // namespace voicelink
