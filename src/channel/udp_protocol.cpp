///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file udp_protocol.cpp
 * @brief Legacy UDP packet encoding and decoding
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "channel/udp_protocol.h"

#include "core/errors.h"

#include <cstring>

namespace XPlaneBridge {
namespace udp {

namespace {

void WriteInt32(std::string& out, int32_t value) {
    const uint32_t v = static_cast<uint32_t>(value);
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

int32_t ReadInt32(const char* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v |= uint32_t(static_cast<uint8_t>(p[i])) << (8 * i);
    return static_cast<int32_t>(v);
}

void WriteFloat(std::string& out, float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    WriteInt32(out, static_cast<int32_t>(bits));
}

float ReadFloat(const char* p) {
    const uint32_t bits = static_cast<uint32_t>(ReadInt32(p));
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

void CheckPath(const std::string& path, size_t field) {
    if (path.empty() || path.size() >= field) {
        throw MalformedPacket("dataref path does not fit a UDP packet: " + path);
    }
}

} // namespace

std::string EncodeSubscription(int32_t frequency, int32_t index, const std::string& path) {
    CheckPath(path, PATH_FIELD);
    std::string out("RREF", 5);
    out.reserve(SUBSCRIPTION_SIZE);
    WriteInt32(out, frequency);
    WriteInt32(out, index);
    out += path;
    out.resize(SUBSCRIPTION_SIZE, '\0');
    return out;
}

std::string EncodeWrite(float value, const std::string& path) {
    CheckPath(path, DREF_PATH_FIELD);
    std::string out("DREF", 5);
    out.reserve(WRITE_SIZE);
    WriteFloat(out, value);
    out += path;
    out.push_back('\0');
    out.resize(WRITE_SIZE, ' ');
    return out;
}

std::string EncodeCommand(const std::string& path) {
    return std::string("CMND", 5) + path;
}

std::vector<std::pair<int32_t, float>> DecodeValues(const std::string& packet) {
    if (packet.size() < 5 || packet.compare(0, 5, "RREF,") != 0) {
        throw MalformedPacket("not an RREF reply (" + std::to_string(packet.size()) + " bytes)");
    }
    std::vector<std::pair<int32_t, float>> values;
    const size_t count = (packet.size() - 5) / 8;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const char* p = packet.data() + 5 + 8 * i;
        float value = ReadFloat(p + 4);
        if (value <= 0.0f && value > -0.001f) value = 0.0f;
        values.emplace_back(ReadInt32(p), value);
    }
    return values;
}

} // namespace udp
} // namespace XPlaneBridge
