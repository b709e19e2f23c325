///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file beacon_decoder.h
 * @brief X-Plane discovery beacon ("BECN") packet layout
 *
 * Packet layout (little-endian):
 *   [0:5]   "BECN\0"
 *   [5]     beacon major version     (1)
 *   [6]     beacon minor version     (0..2)
 *   [7:11]  application host id      (1 = X-Plane, 2 = PlaneMaker)
 *   [11:15] version number           (e.g. 121402 for 12.1.4r2)
 *   [15:19] role                     (1 master, 2 external visual, 3 IOS)
 *   [19:21] port                     (UDP port X-Plane listens on)
 *   [21:]   computer name, NUL terminated
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace XPlaneBridge {

constexpr size_t BEACON_HEADER_SIZE = 21;
constexpr size_t BEACON_MAX_PACKET = 1472;

constexpr uint8_t BEACON_MAJOR_VERSION = 1;
constexpr uint8_t BEACON_MAX_MINOR_VERSION = 2;
constexpr int32_t BEACON_HOST_XPLANE = 1;

/**
 * Decoded beacon. Immutable once built; a new record is produced by every
 * successful discovery.
 */
struct BeaconRecord {
    std::string ip;                 ///< Sender address of the packet
    uint16_t port = 0;
    std::string hostname;
    int32_t app_version = 0;
    uint32_t role = 0;
    uint8_t major = BEACON_MAJOR_VERSION;
    uint8_t minor = 0;
    int32_t host_id = BEACON_HOST_XPLANE;

    /** Same simulator instance (address and port). */
    bool SameHost(const BeaconRecord& other) const { return ip == other.ip && port == other.port; }
};

/**
 * @brief Decodes a beacon packet.
 * @param sender_ip source address reported by the socket, copied to the record
 * @throws MalformedPacket wrong magic, short or oversized packet
 * @throws VersionNotSupported beacon version or application not accepted
 */
BeaconRecord DecodeBeacon(const uint8_t* data, size_t len, const std::string& sender_ip);

inline BeaconRecord DecodeBeacon(const std::string& packet, const std::string& sender_ip) {
    return DecodeBeacon(reinterpret_cast<const uint8_t*>(packet.data()), packet.size(), sender_ip);
}

/** Builds the packet a simulator would send for this record (ip is not encoded). */
std::string EncodeBeacon(const BeaconRecord& record);

} // namespace XPlaneBridge
