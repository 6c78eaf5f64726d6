#pragma once
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

namespace pintrust::socket
{

static constexpr int InvalidSocket = -1;
typedef int SocketType;
typedef sockaddr SocketAddrType;
typedef socklen_t SocketLengthType;
typedef sockaddr_in SockAddrIn4Type;
typedef sockaddr_in6 SockAddrIn6Type;

typedef struct addrinfo AddressInfo;

} // namespace pintrust::socket
