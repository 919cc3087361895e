#include "Game.hpp"
#include "core/Logger.hpp"
#include "networking/UdpTransport.hpp"

namespace Lattice {

const char* GameStateToString(GameState state) {
    switch (state) {
        case GameState::Initializing: return "Initializing";
        case GameState::Connecting:   return "Connecting";
        case GameState::Playing:      return "Playing";
        case GameState::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

const char* GameErrorToString(GameError error) {
    switch (error) {
        case GameError::None:                 return "None";
        case GameError::InitializationFailed: return "InitializationFailed";
        case GameError::NetworkError:         return "NetworkError";
        case GameError::InvalidState:         return "InvalidState";
    }
    return "Unknown";
}

// ============================================================================
// LoggingPresentationFactory
// ============================================================================

void LoggingPresentationFactory::SpawnBundle(EntityRegistry& /*registry*/, EntityId entity, BundleKind kind) {
    m_spawned++;
    APP_LOG_DEBUG("Spawned {} bundle for entity {}", BundleKindToString(kind), entity.ToString());
}

void LoggingPresentationFactory::DespawnBundle(EntityRegistry& /*registry*/, EntityId entity) {
    m_despawned++;
    APP_LOG_DEBUG("Despawned bundle for entity {}", entity.ToString());
}

// ============================================================================
// Game
// ============================================================================

Game::Game() = default;

Game::~Game() {
    Shutdown();
}

std::expected<void, GameError> Game::Initialize(const GameInitParams& params) {
    if (m_state != GameState::Initializing) {
        return std::unexpected(GameError::InvalidState);
    }

    UdpClientSettings settings;
    settings.serverAddress = params.config.serverAddress;
    settings.serverPort = static_cast<uint16_t>(params.config.serverPort);
    settings.connectTimeoutSeconds = params.config.connectTimeoutSeconds;
    settings.timeoutSeconds = params.config.timeoutSeconds;

    auto transport = UdpClientTransport::Connect(settings);
    if (!transport) {
        APP_LOG_ERROR("Failed to reach {}:{}: {}", settings.serverAddress, settings.serverPort,
                      TransportErrorToString(transport.error()));
        return std::unexpected(GameError::NetworkError);
    }

    return CreateSubsystems(params, std::move(*transport));
}

std::expected<void, GameError> Game::Initialize(const GameInitParams& params,
                                                 std::unique_ptr<IClientTransport> transport) {
    if (m_state != GameState::Initializing) {
        return std::unexpected(GameError::InvalidState);
    }
    if (!transport) {
        return std::unexpected(GameError::InitializationFailed);
    }
    return CreateSubsystems(params, std::move(transport));
}

std::expected<void, GameError> Game::CreateSubsystems(const GameInitParams& params,
                                                      std::unique_ptr<IClientTransport> transport) {
    m_config = params.config;

    std::string errorMessage;
    if (!m_config.Validate(errorMessage)) {
        APP_LOG_ERROR("Invalid configuration: {}", errorMessage);
        return std::unexpected(GameError::InitializationFailed);
    }

    LayeredTerrainGenerator::Settings terrain;
    terrain.groundHeight = m_config.groundHeight;
    m_generator = std::make_unique<LayeredTerrainGenerator>(terrain);

    ChunkManagerSettings chunkSettings;
    chunkSettings.maxPendingGeneration = m_config.maxPendingGeneration;
    chunkSettings.asyncGeneration = m_config.asyncGeneration;

    if (m_config.asyncGeneration) {
        m_jobs = std::make_unique<JobSystem>();
        JobSystemConfig jobConfig;
        jobConfig.workerThreads = m_config.workerThreads;
        if (!m_jobs->Initialize(jobConfig)) {
            APP_LOG_ERROR("Failed to start chunk generation workers");
            return std::unexpected(GameError::InitializationFailed);
        }
    }

    m_chunkManager = std::make_unique<ChunkManager>(*m_generator, chunkSettings, m_jobs.get());

    m_transport = std::move(transport);
    m_reconciliation = std::make_unique<ClientReconciliation>(*m_transport, m_registry, &m_presentation);

    m_reconciliation->SetOnChatReceived([](const ChatMessage& chat) {
        APP_LOG_INFO("[chat] {}: {}", chat.clientId, chat.text);
    });
    m_reconciliation->SetOnPlayerJoined([](ClientId client, EntityId entity) {
        APP_LOG_INFO("Player {} joined as entity {}", client, entity.ToString());
    });
    m_reconciliation->SetOnPlayerLeft([](ClientId client, EntityId) {
        APP_LOG_INFO("Player {} left", client);
    });

    if (params.chatMessage && !params.chatMessage->empty()) {
        if (!m_reconciliation->QueueChat(*params.chatMessage)) {
            APP_LOG_WARN("Chat message dropped");
        }
    }

    SetState(GameState::Connecting);
    return {};
}

void Game::Shutdown() {
    if (m_state == GameState::Initializing) {
        return;
    }

    if (m_transport && m_transport->IsConnected()) {
        m_transport->Disconnect();
    }

    // Drop in reverse dependency order
    m_chunkManager.reset();
    if (m_jobs) {
        m_jobs->Shutdown();
    }
    m_jobs.reset();
    m_generator.reset();
    m_reconciliation.reset();
    m_transport.reset();
    m_registry.Clear();

    m_state = GameState::Initializing;
}

void Game::SetState(GameState state) {
    if (m_state == state) {
        return;
    }
    APP_LOG_INFO("Client state {} -> {}", GameStateToString(m_state), GameStateToString(state));
    m_state = state;
}

void Game::Update(float deltaTime) {
    if (!IsRunning()) {
        return;
    }

    m_reconciliation->Tick(deltaTime);

    switch (m_transport->GetState()) {
        case ClientConnectionState::Connecting:
            break;
        case ClientConnectionState::Connected:
            if (m_state == GameState::Connecting) {
                APP_LOG_INFO("Connected as client {}", m_transport->GetClientId());
                SetState(GameState::Playing);
            }
            break;
        case ClientConnectionState::Denied:
        case ClientConnectionState::Disconnected:
            if (auto reason = m_transport->GetDisconnectReason()) {
                APP_LOG_WARN("Connection closed: {}", DisconnectReasonToString(*reason));
            }
            SetState(GameState::Disconnected);
            return;
    }

    if (m_state == GameState::Playing) {
        UpdatePlaying(deltaTime);
    }
}

void Game::UpdatePlaying(float deltaTime) {
    m_totalPlayTime += deltaTime;

    auto controlled = m_reconciliation->GetControlledEntity();
    if (!controlled) {
        return;
    }

    // Score the controlled player once per tick
    if (auto* stats = m_registry.GetStats(*controlled)) {
        stats->score += 1;
    } else {
        m_registry.SetStats(*controlled, PlayerStats{1});
    }

    const Transform* transform = m_registry.GetTransform(*controlled);
    if (!transform) {
        return;
    }

    m_chunkManager->Tick(transform->translation, m_config.viewDistance);

    for (const auto& ready : m_chunkManager->DrainReadyEvents()) {
        m_chunksReady++;
        APP_LOG_DEBUG("Chunk ({}, {}) ready", ready.coord.x, ready.coord.y);
    }
}

int64_t Game::GetScore() const {
    if (!m_reconciliation) {
        return 0;
    }
    auto controlled = m_reconciliation->GetControlledEntity();
    if (!controlled) {
        return 0;
    }
    const auto* stats = m_registry.GetStats(*controlled);
    return stats ? stats->score : 0;
}

} // namespace Lattice
