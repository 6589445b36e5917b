#pragma once

#include <asio/io_context.hpp>

#include "lanxfer/engine/config.hpp"
#include "lanxfer/engine/device_info.hpp"
#include "lanxfer/engine/lifecycle.hpp"
#include "lanxfer/engine/notifier.hpp"
#include "lanxfer/engine/session_registry.hpp"

namespace lanxfer::engine
{

    class ConnectionHandler;
    class TransferServer;

    /// Shared collaborators handed to the pipelines; all owned by TransferService.
    struct EngineServices
    {
        asio::io_context &io_context;
        const TransferConfig &config;
        SessionRegistry &registry;
        SessionLifecycle &lifecycle;
        TransferServer &server;
        ConnectionHandler &handler;
        const DeviceInfo &device;
    };

} // namespace lanxfer::engine
