#include "ServerManager.hpp"
#include "core/Logger.hpp"
#include "networking/UdpTransport.hpp"

#include <chrono>

namespace Lattice {

static uint64_t GetTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

const char* ServerStatusToString(ServerStatus status) {
    switch (status) {
        case ServerStatus::Stopped:  return "Stopped";
        case ServerStatus::Starting: return "Starting";
        case ServerStatus::Running:  return "Running";
        case ServerStatus::Stopping: return "Stopping";
        case ServerStatus::Error:    return "Error";
    }
    return "Unknown";
}

ServerManager::ServerManager() = default;

ServerManager::~ServerManager() {
    Shutdown();
}

std::expected<void, TransportError> ServerManager::Initialize(const ServerConfig& config) {
    m_config = config;
    m_status = ServerStatus::Starting;

    UdpServerSettings settings;
    settings.bindAddress = config.bindAddress;
    settings.port = static_cast<uint16_t>(config.port);
    settings.maxClients = static_cast<size_t>(config.maxClients);
    settings.timeoutSeconds = config.timeoutSeconds;

    auto transport = UdpServerTransport::Create(settings);
    if (!transport) {
        m_status = ServerStatus::Error;
        LogError(std::string("Failed to start transport: ") + TransportErrorToString(transport.error()));
        return std::unexpected(transport.error());
    }

    m_boundPort = (*transport)->GetBoundPort();
    Attach(std::move(*transport));

    LogMessage("Listening on " + m_config.bindAddress + ":" + std::to_string(m_boundPort));
    return {};
}

void ServerManager::Initialize(const ServerConfig& config, std::unique_ptr<IServerTransport> transport) {
    m_config = config;
    m_status = ServerStatus::Starting;
    m_boundPort = 0;
    Attach(std::move(transport));
}

void ServerManager::Attach(std::unique_ptr<IServerTransport> transport) {
    m_replication.reset();
    m_registry.Clear();
    m_transport = std::move(transport);

    ReplicationSettings settings;
    settings.spawnHalfExtent = m_config.spawnHalfExtent;
    settings.spawnHeight = m_config.spawnHeight;
    settings.spawnSeed = m_config.spawnSeed;
    m_replication = std::make_unique<ServerReplication>(*m_transport, m_registry, settings);

    m_replication->SetOnPlayerJoined([this](ClientId client, EntityId entity) {
        LogMessage("Client " + std::to_string(client) + " joined as entity " + entity.ToString() +
                   " (" + std::to_string(m_replication->GetPlayerCount()) + "/" +
                   std::to_string(m_config.maxClients) + ")");
    });
    m_replication->SetOnPlayerLeft([this](ClientId client, EntityId) {
        LogMessage("Client " + std::to_string(client) + " left");
    });
    m_replication->SetOnPlayerCommand([](ClientId client, const PlayerCommand& command) {
        APP_LOG_DEBUG("Client {} command {} at ({}, {}, {})", client,
                      CommandActionToString(command.action),
                      command.target.x, command.target.y, command.target.z);
    });
    m_replication->SetOnChatMessage([](const ChatMessage& chat) {
        APP_LOG_INFO("[chat] {}: {}", chat.clientId, chat.text);
    });

    m_tickCount = 0;
    m_totalTickTime = 0.0f;
    m_startTime = GetTimestamp();
    m_status = ServerStatus::Running;

    LogMessage("Server started: " + m_config.serverName);
}

void ServerManager::Shutdown() {
    if (m_status != ServerStatus::Running) {
        return;
    }

    m_status = ServerStatus::Stopping;
    LogMessage("Stopping server...");

    if (m_transport) {
        m_transport->Shutdown();
    }
    m_replication.reset();
    m_transport.reset();
    m_registry.Clear();

    m_status = ServerStatus::Stopped;
    LogMessage("Server shut down");
}

void ServerManager::Update(float deltaTime) {
    if (m_status != ServerStatus::Running || !m_replication) {
        return;
    }

    auto tickStart = std::chrono::steady_clock::now();

    m_replication->Tick(deltaTime);

    auto tickEnd = std::chrono::steady_clock::now();
    m_totalTickTime += std::chrono::duration<float, std::milli>(tickEnd - tickStart).count();
    m_tickCount++;
}

ServerStats ServerManager::GetStatistics() const {
    ServerStats stats;
    stats.tickCount = m_tickCount;
    if (m_tickCount > 0) {
        stats.avgTickTime = m_totalTickTime / static_cast<float>(m_tickCount);
    }

    if (m_status == ServerStatus::Running) {
        stats.uptimeSeconds = GetTimestamp() - m_startTime;
    }

    if (m_replication) {
        const auto& replication = m_replication->GetStats();
        stats.connectedClients = m_replication->GetPlayerCount();
        stats.worldEntities = m_replication->GetWorldEntities().size();
        stats.messagesSent = replication.messagesSent;
        stats.messagesReceived = replication.messagesReceived;
        stats.messagesDropped = replication.messagesDropped;
    }

    return stats;
}

void ServerManager::LogMessage(const std::string& message) {
    APP_LOG_INFO("{}", message);
    if (OnServerMessage) {
        OnServerMessage(message);
    }
}

void ServerManager::LogError(const std::string& error) {
    APP_LOG_ERROR("{}", error);
    if (OnError) {
        OnError(error);
    }
}

} // namespace Lattice
