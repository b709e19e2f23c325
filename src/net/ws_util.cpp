///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file ws_util.cpp
 * @brief SHA-1 and Base64 implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/ws_util.h"

#include <cstring>

namespace XPlaneBridge {
namespace ws_util {

namespace {

const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline uint32_t Rol(uint32_t value, uint32_t bits) {
    return (value << bits) | (value >> (32 - bits));
}

void Sha1Transform(uint32_t state[5], const uint8_t buffer[64]) {
    uint32_t a, b, c, d, e, t, W[80];
    for (int i = 0; i < 16; ++i) {
        W[i] = (uint32_t(buffer[i*4+0]) << 24) | (uint32_t(buffer[i*4+1]) << 16) |
               (uint32_t(buffer[i*4+2]) << 8) | uint32_t(buffer[i*4+3]);
    }
    for (int i = 16; i < 80; ++i) {
        W[i] = Rol(W[i-3] ^ W[i-8] ^ W[i-14] ^ W[i-16], 1);
    }
    a = state[0]; b = state[1]; c = state[2]; d = state[3]; e = state[4];
    for (int i = 0; i < 80; ++i) {
        uint32_t f, k;
        if (i < 20) { f = (b & c) | ((~b) & d); k = 0x5A827999; }
        else if (i < 40) { f = b ^ c ^ d; k = 0x6ED9EBA1; }
        else if (i < 60) { f = (b & c) | (b & d) | (c & d); k = 0x8F1BBCDC; }
        else { f = b ^ c ^ d; k = 0xCA62C1D6; }
        t = Rol(a,5) + f + e + k + W[i];
        e = d; d = c; c = Rol(b,30); b = a; a = t;
    }
    state[0] += a; state[1] += b; state[2] += c; state[3] += d; state[4] += e;
}

int DecodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace

void Sha1Init(Sha1Context& ctx) {
    ctx.state[0] = 0x67452301;
    ctx.state[1] = 0xEFCDAB89;
    ctx.state[2] = 0x98BADCFE;
    ctx.state[3] = 0x10325476;
    ctx.state[4] = 0xC3D2E1F0;
    ctx.count = 0;
}

void Sha1Update(Sha1Context& ctx, const uint8_t* data, size_t len) {
    size_t i = 0;
    size_t j = (ctx.count >> 3) % 64;
    ctx.count += (uint64_t)len << 3;
    size_t part_len = 64 - j;
    if (len >= part_len) {
        std::memcpy(&ctx.buffer[j], &data[0], part_len);
        Sha1Transform(ctx.state, ctx.buffer);
        for (i = part_len; i + 63 < len; i += 64) {
            Sha1Transform(ctx.state, &data[i]);
        }
        j = 0;
    } else {
        i = 0;
    }
    std::memcpy(&ctx.buffer[j], &data[i], len - i);
}

void Sha1Final(Sha1Context& ctx, uint8_t digest[20]) {
    uint8_t finalcount[8];
    for (int i = 0; i < 8; ++i) {
        finalcount[i] = (uint8_t)((ctx.count >> ((7 - i) * 8)) & 0xFF);
    }
    uint8_t c = 0x80;
    Sha1Update(ctx, &c, 1);
    uint8_t zero = 0x00;
    while ((ctx.count & 0x1FF) != 448) { // mod 512 bits -> 56 bytes
        Sha1Update(ctx, &zero, 1);
    }
    Sha1Update(ctx, finalcount, 8);
    for (int i = 0; i < 20; ++i) {
        digest[i] = (uint8_t)((ctx.state[i>>2] >> ((3 - (i & 3)) * 8)) & 0xFF);
    }
}

std::array<uint8_t, 20> Sha1(const std::string& input) {
    Sha1Context ctx;
    Sha1Init(ctx);
    Sha1Update(ctx, reinterpret_cast<const uint8_t*>(input.data()), input.size());
    std::array<uint8_t, 20> digest{};
    Sha1Final(ctx, digest.data());
    return digest;
}

std::string Base64Encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | ((i+1 < len ? uint32_t(data[i+1]) : 0) << 8) |
                     (i+2 < len ? uint32_t(data[i+2]) : 0);
        out.push_back(kAlphabet[(n >> 18) & 63]);
        out.push_back(kAlphabet[(n >> 12) & 63]);
        out.push_back(i+1 < len ? kAlphabet[(n >> 6) & 63] : '=');
        out.push_back(i+2 < len ? kAlphabet[n & 63] : '=');
    }
    return out;
}

bool Base64Decode(const std::string& input, std::string& output) {
    output.clear();
    output.reserve((input.size() / 4) * 3);
    uint32_t acc = 0;
    int bits = 0;
    for (char c : input) {
        if (c == '=') break;
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        int v = DecodeChar(c);
        if (v < 0) return false;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return true;
}

std::string ComputeAcceptKey(const std::string& key) {
    auto digest = Sha1(key + kWebSocketGuid);
    return Base64Encode(digest.data(), digest.size());
}

} // namespace ws_util
} // namespace XPlaneBridge
