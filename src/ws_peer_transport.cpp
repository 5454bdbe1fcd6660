#include "cruxenclave/ws_peer_transport.hpp"

#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"

namespace CruxEnclave {
    namespace net {

        WsPeerTransport::WsPeerTransport() {
            client_.init_asio();
            client_.clear_access_channels(websocketpp::log::alevel::all);
            client_.clear_error_channels(websocketpp::log::elevel::all);
        }

        WsPeerTransport::~WsPeerTransport() {
            stop();
        }

        void WsPeerTransport::start() {
            if (client_thread_) {
                return;
            }
            client_.start_perpetual();
            client_thread_ = std::make_unique<std::thread>([this]() {
                try {
                    client_.run();
                } catch (const std::exception& e) {
                    LOG_ERROR << "Peer transport thread exception: " << e.what();
                }
            });
        }

        void WsPeerTransport::stop() {
            if (!client_thread_) {
                return;
            }

            // Let queued pushes drain, then stop the loop
            client_.stop_perpetual();
            if (client_thread_->joinable()) {
                client_thread_->join();
            }
            client_thread_.reset();
        }

        void WsPeerTransport::push(const EncryptedPayload& envelope, const std::string& url) {
            Frame frame;
            frame.op_code = OpCodes::PUSH_PAYLOAD;
            frame.body = envelope.serialize();
            send_frame(frame, url);
        }

        void WsPeerTransport::push_party_info(const byte_vector& encoded_party_info, const std::string& url) {
            Frame frame;
            frame.op_code = OpCodes::PARTY_INFO;
            frame.body = encoded_party_info;
            send_frame(frame, url);
        }

        void WsPeerTransport::send_frame(const Frame& frame, const std::string& url) {
            if (!client_thread_) {
                throw LogicError("Peer transport is not started.");
            }

            if (is_tls_url(url)) {
                LOG_WARN << "Skipping push, TLS peers are not supported, url=" << url;
                return;
            }

            websocketpp::lib::error_code ec;
            WsClient::connection_ptr con = client_.get_connection(to_ws_uri(url), ec);
            if (ec) {
                LOG_WARN << "Could not create connection, url=" << url << ", error=" << ec.message();
                return;
            }

            auto data = std::make_shared<byte_vector>(frame.serialize());

            con->set_open_handler([this, data, url](WsConnectionHdl hdl) {
                websocketpp::lib::error_code send_ec;
                client_.send(hdl, data->data(), data->size(), BINDATA_OPCODE, send_ec);
                if (send_ec) {
                    LOG_WARN << "Push failed, url=" << url << ", error=" << send_ec.message();
                }
                websocketpp::lib::error_code close_ec;
                client_.close(hdl, websocketpp::close::status::normal, "", close_ec);
                if (close_ec) {
                    LOG_DEBUG << "Error closing push connection, url=" << url << ", error=" << close_ec.message();
                }
            });

            con->set_fail_handler([this, url](WsConnectionHdl hdl) {
                WsClient::connection_ptr failed = client_.get_con_from_hdl(hdl);
                LOG_WARN << "Unable to reach peer, url=" << url << ", error=" << failed->get_ec().message();
            });

            client_.connect(con);
            LOG_DEBUG << "Queued push, url=" << url << ", opCode=" << frame.op_code << ", bytes=" << data->size();
        }

    }  // namespace net
}  // namespace CruxEnclave
