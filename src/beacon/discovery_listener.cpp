///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file discovery_listener.cpp
 * @brief UDP multicast beacon reception
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "beacon/discovery_listener.h"

#include "core/errors.h"
#include "net/socket.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>

namespace XPlaneBridge {

DiscoveryListener::DiscoveryListener(const BridgeConfig& config, LoggerPtr log)
    : config(config), log(std::move(log)) {}

BeaconRecord DiscoveryListener::Discover(std::chrono::milliseconds timeout) {
    Socket sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.IsValid()) {
        throw IpNotFound(ErrnoText("beacon socket()"));
    }

    int yes = 1;
    ::setsockopt(sock.Fd(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#ifdef SO_REUSEPORT
    ::setsockopt(sock.Fd(), SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
#endif

    in_addr group{};
    if (::inet_pton(AF_INET, config.mcast_group.c_str(), &group) != 1) {
        throw IpNotFound("invalid multicast group " + config.mcast_group);
    }

    // Binding the group address only delivers packets sent to that group
    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_port = htons(config.mcast_port);
    local.sin_addr.s_addr = config.bind_any ? htonl(INADDR_ANY) : group.s_addr;
    if (::bind(sock.Fd(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        throw IpNotFound(ErrnoText("beacon bind(" + config.mcast_group + ":" + std::to_string(config.mcast_port) + ")"));
    }

    ip_mreq mreq{};
    mreq.imr_multiaddr = group;
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (::setsockopt(sock.Fd(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
        // No multicast route (e.g. isolated host); unicast beacons still arrive
        LOG_WARN(log, "{}", ErrnoText("IP_ADD_MEMBERSHIP " + config.mcast_group));
    }

    if (!sock.WaitReadable(timeout)) {
        LOG_DEBUG(log, "X-Plane beacon not received within {} ms", timeout.count());
        throw IpNotFound();
    }

    uint8_t packet[BEACON_MAX_PACKET];
    sockaddr_in sender{};
    socklen_t sender_len = sizeof(sender);
    ssize_t n = ::recvfrom(sock.Fd(), packet, sizeof(packet), 0, reinterpret_cast<sockaddr*>(&sender), &sender_len);
    if (n < 0) {
        throw IpNotFound(ErrnoText("beacon recvfrom()"));
    }

    char sender_ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &sender.sin_addr, sender_ip, sizeof(sender_ip));

    try {
        BeaconRecord rec = DecodeBeacon(packet, static_cast<size_t>(n), sender_ip);
        LOG_INFO(log, "X-Plane beacon from {} ({}), version {}, port {}, role {} (beacon {}.{}.{})",
                 rec.ip, rec.hostname, rec.app_version, rec.port, rec.role, rec.major, rec.minor, rec.host_id);
        return rec;
    } catch (const MalformedPacket& e) {
        LOG_WARN(log, "{}", e.what());
        throw IpNotFound(e.what());
    } catch (const VersionNotSupported& e) {
        LOG_WARN(log, "{}", e.what());
        throw;
    }
}

} // namespace XPlaneBridge
