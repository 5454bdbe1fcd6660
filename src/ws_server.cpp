#include "cruxenclave/ws_server.hpp"

#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"

namespace CruxEnclave {
    namespace net {

        WsEnclaveServer::WsEnclaveServer(EnclaveService& service) : service_(service) {
            server_.init_asio();
            server_.set_reuse_addr(true);
            server_.set_open_handler(std::bind(&WsEnclaveServer::on_open, this, std::placeholders::_1));
            server_.set_close_handler(std::bind(&WsEnclaveServer::on_close, this, std::placeholders::_1));
            server_.set_message_handler(
                std::bind(&WsEnclaveServer::on_message, this, std::placeholders::_1, std::placeholders::_2));
            server_.clear_access_channels(websocketpp::log::alevel::all);
        }

        WsEnclaveServer::~WsEnclaveServer() {
            stop();
        }

        void WsEnclaveServer::run(uint16_t port) {
            server_thread_ = std::make_unique<std::thread>([this, port]() {
                try {
                    server_.listen(port);
                    server_.start_accept();
                    LOG_INFO << "Enclave server listening, port=" << port;
                    server_.run();
                } catch (const std::exception& e) {
                    LOG_ERROR << "Server thread exception: " << e.what();
                }
            });
        }

        void WsEnclaveServer::stop() {
            if (!server_thread_) {
                return;
            }

            if (server_.is_listening()) {
                websocketpp::lib::error_code ec;
                server_.stop_listening(ec);
            }

            // Close every open connection so run() can return
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                for (const auto& hdl : connections_) {
                    websocketpp::lib::error_code ec;
                    server_.close(hdl, websocketpp::close::status::going_away, "Server shutdown", ec);
                    if (ec) {
                        LOG_DEBUG << "Error closing connection: " << ec.message();
                    }
                }
                connections_.clear();
            }

            server_.stop();

            if (server_thread_->joinable()) {
                server_thread_->join();
            }
            server_thread_.reset();
        }

        void WsEnclaveServer::on_open(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.insert(hdl);
        }

        void WsEnclaveServer::on_close(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.erase(hdl);
        }

        void WsEnclaveServer::on_message(WsConnectionHdl hdl, WsMessagePtr msg) {
            if (msg->get_opcode() != BINDATA_OPCODE) {
                return;  // Ignore non-binary messages
            }

            try {
                byte_vector data(msg->get_payload().begin(), msg->get_payload().end());
                Frame frame = Frame::deserialize(data);

                std::optional<Frame> reply = service_.handle(frame);
                if (reply) {
                    byte_vector out = reply->serialize();
                    server_.send(hdl, out.data(), out.size(), BINDATA_OPCODE);
                }
            } catch (const std::exception& e) {
                LOG_WARN << "Message processing failed: " << e.what();
                websocketpp::lib::error_code ec;
                server_.close(hdl, websocketpp::close::status::policy_violation, "Malformed frame", ec);
            }
        }

    }  // namespace net
}  // namespace CruxEnclave
