///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file ws_util.h
 * @brief Minimal SHA-1 and Base64 helpers for the WebSocket handshake and
 *        for string datarefs (base64 encoded by the simulator)
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace XPlaneBridge {
namespace ws_util {

struct Sha1Context {
    uint32_t state[5];
    uint64_t count; // bits
    uint8_t buffer[64];
};

void Sha1Init(Sha1Context& ctx);
void Sha1Update(Sha1Context& ctx, const uint8_t* data, size_t len);
void Sha1Final(Sha1Context& ctx, uint8_t digest[20]);

/** SHA-1 digest of a whole string. */
std::array<uint8_t, 20> Sha1(const std::string& input);

std::string Base64Encode(const uint8_t* data, size_t len);
inline std::string Base64Encode(const std::string& data) {
    return Base64Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

/**
 * Decodes standard base64 (with or without padding, whitespace ignored).
 * @return false if a character outside the alphabet is found
 */
bool Base64Decode(const std::string& input, std::string& output);

/** Sec-WebSocket-Accept value for a Sec-WebSocket-Key (RFC 6455 section 4.2.2). */
std::string ComputeAcceptKey(const std::string& key);

} // namespace ws_util
} // namespace XPlaneBridge
