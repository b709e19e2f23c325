///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file udp_protocol.h
 * @brief X-Plane legacy UDP packets: RREF subscriptions, DREF writes, CMND
 *
 * Used when the simulator has no web API. All integers and floats are little
 * endian, the layout follows the "Exchanging Data with X-Plane" document.
 *
 *   RREF request : "RREF\0" | freq int32 | index int32 | path, NUL padded to 400
 *   RREF reply   : "RREF," | n * (index int32 | value float32)
 *   DREF         : "DREF\0" | value float32 | path NUL, space padded to 500
 *   CMND         : "CMND\0" | path
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace XPlaneBridge {
namespace udp {

constexpr uint16_t DEFAULT_PORT = 49000;
constexpr size_t PATH_FIELD = 400;          ///< RREF path field, NUL included
constexpr size_t DREF_PATH_FIELD = 500;
constexpr size_t SUBSCRIPTION_SIZE = 5 + 4 + 4 + PATH_FIELD;
constexpr size_t WRITE_SIZE = 5 + 4 + DREF_PATH_FIELD;
constexpr size_t MAX_REPLY = 1472;          ///< Largest reply datagram the simulator sends
constexpr int MAX_FREQUENCY = 100;

/**
 * @brief RREF request. Frequency 0 stops the values for this index.
 * @throws MalformedPacket if the path does not fit the path field
 */
std::string EncodeSubscription(int32_t frequency, int32_t index, const std::string& path);

/**
 * @brief DREF write of one value. Element writes use "path[i]".
 * @throws MalformedPacket if the path does not fit the path field
 */
std::string EncodeWrite(float value, const std::string& path);

/** CMND packet, one press of the command. */
std::string EncodeCommand(const std::string& path);

/**
 * @brief Splits an RREF reply into (index, value) pairs.
 * A trailing partial entry is ignored, tiny negative values read as 0.
 * @throws MalformedPacket if the header is not "RREF,"
 */
std::vector<std::pair<int32_t, float>> DecodeValues(const std::string& packet);

} // namespace udp
} // namespace XPlaneBridge
