///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file beacon_decoder.cpp
 * @brief Beacon packet decoding and encoding
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "beacon/beacon_decoder.h"

#include "core/errors.h"

#include <cstring>
#include <type_traits>

namespace XPlaneBridge {

namespace {

const char BEACON_MAGIC[5] = {'B', 'E', 'C', 'N', '\0'};

template <typename T>
T ReadLE(const uint8_t* p) {
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v |= uint64_t(p[i]) << (8 * i);
    }
    return static_cast<T>(v);
}

template <typename T>
void WriteLE(std::string& out, T value) {
    uint64_t v = static_cast<uint64_t>(static_cast<typename std::make_unsigned<T>::type>(value));
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

} // namespace

BeaconRecord DecodeBeacon(const uint8_t* data, size_t len, const std::string& sender_ip) {
    if (len < BEACON_HEADER_SIZE) {
        throw MalformedPacket("beacon packet too short (" + std::to_string(len) + " bytes)");
    }
    if (len > BEACON_MAX_PACKET) {
        throw MalformedPacket("beacon packet too long (" + std::to_string(len) + " bytes)");
    }
    if (std::memcmp(data, BEACON_MAGIC, sizeof(BEACON_MAGIC)) != 0) {
        throw MalformedPacket("unknown packet from " + sender_ip + ", " + std::to_string(len) + " bytes");
    }

    BeaconRecord rec;
    rec.ip = sender_ip;
    rec.major = data[5];
    rec.minor = data[6];
    rec.host_id = ReadLE<int32_t>(data + 7);
    rec.app_version = ReadLE<int32_t>(data + 11);
    rec.role = ReadLE<uint32_t>(data + 15);
    rec.port = ReadLE<uint16_t>(data + 19);

    // Hostname runs to the first NUL, or to the end if the sender omitted it
    const char* name = reinterpret_cast<const char*>(data + BEACON_HEADER_SIZE);
    const size_t name_max = len - BEACON_HEADER_SIZE;
    const void* nul = std::memchr(name, '\0', name_max);
    rec.hostname.assign(name, nul ? static_cast<const char*>(nul) - name : name_max);

    if (rec.major != BEACON_MAJOR_VERSION || rec.minor > BEACON_MAX_MINOR_VERSION ||
        rec.host_id != BEACON_HOST_XPLANE) {
        throw VersionNotSupported("X-Plane beacon version not supported: " + std::to_string(rec.major) + "." +
                                  std::to_string(rec.minor) + "." + std::to_string(rec.host_id));
    }
    return rec;
}

std::string EncodeBeacon(const BeaconRecord& record) {
    std::string out(BEACON_MAGIC, sizeof(BEACON_MAGIC));
    out.reserve(BEACON_HEADER_SIZE + record.hostname.size() + 1);
    out.push_back(static_cast<char>(record.major));
    out.push_back(static_cast<char>(record.minor));
    WriteLE<int32_t>(out, record.host_id);
    WriteLE<int32_t>(out, record.app_version);
    WriteLE<uint32_t>(out, record.role);
    WriteLE<uint16_t>(out, record.port);
    out.append(record.hostname);
    out.push_back('\0');
    return out;
}

} // namespace XPlaneBridge
