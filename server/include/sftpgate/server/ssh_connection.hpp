#pragma once

#include <memory>

#include "sftpgate/server/remote_connection.hpp"

namespace sftpgate::server
{

    // Opens SFTP channels with libssh2: TCP connect bounded by the request timeout, SSH handshake,
    // password (or keyboard-interactive) authentication, blocking mode with the same timeout applied
    // to every later call.
    class SshConnectionFactory : public ConnectionFactory
    {
    public:
        SshConnectionFactory();

        std::unique_ptr<RemoteConnection> connect(const ConnectionRequest &request) override;
    };

} // namespace sftpgate::server
