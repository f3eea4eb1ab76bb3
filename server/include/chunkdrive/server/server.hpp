#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkdrive/server/chunk_receiver.hpp"
#include "chunkdrive/server/chunk_writer.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/finalizer.hpp"
#include "chunkdrive/server/path_guard.hpp"
#include "chunkdrive/server/reaper.hpp"
#include "chunkdrive/server/session_registry.hpp"

namespace chunkdrive::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        PathGuard paths_;
        SessionRegistry registry_;
        ChunkWriter writer_;
        Finalizer finalizer_;
        Reaper reaper_;
        ChunkReceiver receiver_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkdrive::server
