#include "channel.hpp"
#include "spawn_channel.hpp"
#include "tcp_channel.hpp"

std::unique_ptr<Channel> open_channel(const ServerConfig& server) {
    switch (server.transport) {
    case Transport::TCP:
        return std::make_unique<TcpChannel>(server.host, server.port,
                                            std::chrono::seconds(server.connect_timeout));
    case Transport::SPAWN:
        break;
    }
    return SpawnChannel::from_template(server.command, server.host, server.port);
}
