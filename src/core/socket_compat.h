#pragma once

// Winsock-style names over POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <string>

using SOCKET = int;
constexpr SOCKET INVALID_SOCKET = -1;

inline int closesocket(SOCKET s) {
    return ::close(s);
}

inline std::string peerToString(const sockaddr_in& peer) {
    char ipbuf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &peer.sin_addr, ipbuf, sizeof(ipbuf));
    return std::string(ipbuf) + ":" + std::to_string(ntohs(peer.sin_port));
}
