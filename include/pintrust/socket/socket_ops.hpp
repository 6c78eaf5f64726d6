/// @file
/// @brief Declaraion of socket operations functions.

#pragma once
#include <cstddef>
#include <system_error>
#include <pintrust/socket/types.hpp>

namespace pintrust::socket
{

/// @brief Creates a socket and returns its descriptor.
///
/// @param domain The protocol family (e.g., AF_INET).
/// @param socktype The type of socket (e.g., SOCK_STREAM).
/// @param protocol The protocol to be used (e.g., IPPROTO_TCP).
/// @param ec Outputs the error code if socket creation fails.
///
/// @return A socket descriptor, or `InvalidSocket` on failure.
SocketType CreateSocket(int domain, int socktype, int protocol, std::error_code& ec);

/// @brief Creates a socket using a protocol object for configuration.
template <typename Protocol> SocketType CreateSocket(const Protocol& protocol, std::error_code& ec)
{
    return CreateSocket(protocol.family(), protocol.type(), protocol.protocol(), ec);
}

/// @brief Closes an open socket.
///
/// @param sock The socket descriptor to close.
void CloseSocket(SocketType sock);

/// @brief Connects a socket to a specified address.
///
/// A non-blocking socket reports `operation_in_progress` through @p ec while
/// the connection is being established.
///
/// @param sock The socket descriptor to use for connection.
/// @param addr The destination address.
/// @param addrlen The length of the address.
/// @param ec Outputs the error code if the connection fails.
void Connect(SocketType sock, const SocketAddrType* addr, SocketLengthType addrlen, std::error_code& ec);

/// @brief Gets a socket option.
///
/// @param s The socket descriptor from which to retrieve the option.
/// @param level The level at which the option is defined.
/// @param optname The option name.
/// @param optval Outputs the option value.
/// @param optlen Input as the size of the buffer for `optval`, outputs the actual size.
/// @param ec Outputs the error code if the operation fails.
///
/// @return Zero on success, or a negative value if the operation fails.
int GetSocketOption(SocketType s, int level, int optname, void* optval, std::size_t* optlen,
                    std::error_code& ec);

/// @brief Retrieves the pending error for a socket (`SO_ERROR`).
///
/// @param s The socket to check.
///
/// @return `std::error_code` indicating the last socket error.
std::error_code GetSocketError(SocketType s);

/// @brief Sets a socket to blocking or non-blocking mode.
///
/// @param s The socket to configure.
/// @param value Set to `true` for non-blocking, `false` for blocking.
/// @param ec Output parameter for error codes.
void SetNonBlocking(SocketType s, bool value, std::error_code& ec);

} // namespace pintrust::socket
