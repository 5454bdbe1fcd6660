#include "cruxenclave/ws_client.hpp"

#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"

namespace CruxEnclave {
    namespace net {

        WsEnclaveClient::WsEnclaveClient() {
            client_.init_asio();
            client_.set_open_handler(std::bind(&WsEnclaveClient::on_open, this, std::placeholders::_1));
            client_.set_close_handler(std::bind(&WsEnclaveClient::on_close, this, std::placeholders::_1));
            client_.set_fail_handler(std::bind(&WsEnclaveClient::on_fail, this, std::placeholders::_1));
            client_.set_message_handler(
                std::bind(&WsEnclaveClient::on_message, this, std::placeholders::_1, std::placeholders::_2));
            client_.clear_access_channels(websocketpp::log::alevel::all);
        }

        WsEnclaveClient::~WsEnclaveClient() {
            disconnect();
        }

        void WsEnclaveClient::connect(const std::string& uri) {
            if (client_thread_) {
                throw LogicError("Client is already connected.");
            }

            if (is_tls_url(uri)) {
                throw InvalidArgument("TLS endpoints are not supported: " + uri);
            }

            // A previous disconnect() stopped the io loop
            client_.reset();

            websocketpp::lib::error_code ec;
            WsClient::connection_ptr con = client_.get_connection(to_ws_uri(uri), ec);
            if (ec) {
                throw RuntimeError("Could not create connection: " + ec.message());
            }

            client_.connect(con);
            client_thread_ = std::make_unique<std::thread>(&WsEnclaveClient::run_client, this);
        }

        void WsEnclaveClient::disconnect() {
            // If the client thread doesn't exist, we have nothing to do.
            if (!client_thread_) {
                return;
            }

            // If the connection is open, request a clean close.
            if (is_connected_) {
                websocketpp::lib::error_code ec;
                client_.close(connection_hdl_, websocketpp::close::status::going_away, "", ec);
                if (ec) {
                    LOG_DEBUG << "Close failed: " << ec.message();
                }
            }

            client_.stop();

            if (client_thread_->joinable()) {
                client_thread_->join();
            }

            client_thread_.reset();
            is_connected_ = false;
            fail_pending("Client disconnected");
        }

        void WsEnclaveClient::fail_pending(const std::string& reason) {
            std::lock_guard<std::mutex> lock(pending_requests_mutex_);
            for (auto& pair : pending_requests_) {
                pair.second.set_exception(std::make_exception_ptr(RuntimeError(reason)));
            }
            pending_requests_.clear();
        }

        std::future<Response> WsEnclaveClient::store(const byte_vector& message, const std::string& sender,
                                                     const std::vector<std::string>& recipients) {
            uint32_t request_id = next_request_id_++;
            return send_request(request_id, Requests::store(request_id, message, sender, recipients));
        }

        std::future<Response> WsEnclaveClient::retrieve(const Digest& digest) {
            uint32_t request_id = next_request_id_++;
            return send_request(request_id, Requests::retrieve(request_id, digest));
        }

        std::future<Response> WsEnclaveClient::remove(const Digest& digest) {
            uint32_t request_id = next_request_id_++;
            return send_request(request_id, Requests::remove(request_id, digest));
        }

        std::future<Response> WsEnclaveClient::send_request(uint32_t request_id, const Frame& request) {
            if (!is_connected_) {
                throw LogicError("Client is not connected.");
            }

            auto promise = std::promise<Response>();
            auto future = promise.get_future();

            {
                std::lock_guard<std::mutex> lock(pending_requests_mutex_);
                pending_requests_[request_id] = std::move(promise);
            }

            byte_vector packet = request.serialize();
            websocketpp::lib::error_code ec;
            client_.send(connection_hdl_, packet.data(), packet.size(), BINDATA_OPCODE, ec);
            if (ec) {
                std::lock_guard<std::mutex> lock(pending_requests_mutex_);
                pending_requests_.erase(request_id);
                throw RuntimeError("Error sending request: " + ec.message());
            }

            return future;
        }

        void WsEnclaveClient::set_on_ready_callback(OnReadyCallback callback) {
            on_ready_callback_ = std::move(callback);
        }

        void WsEnclaveClient::set_on_disconnect_callback(OnDisconnectCallback callback) {
            on_disconnect_callback_ = std::move(callback);
        }

        void WsEnclaveClient::on_open(WsConnectionHdl hdl) {
            connection_hdl_ = hdl;
            is_connected_ = true;
            if (on_ready_callback_) {
                on_ready_callback_();
            }
        }

        void WsEnclaveClient::on_close(WsConnectionHdl hdl) {
            is_connected_ = false;
            if (on_disconnect_callback_) {
                on_disconnect_callback_();
            }
        }

        void WsEnclaveClient::on_fail(WsConnectionHdl hdl) {
            is_connected_ = false;
            LOG_WARN << "Connection failed: " << client_.get_con_from_hdl(hdl)->get_ec().message();
            if (on_disconnect_callback_) {
                on_disconnect_callback_();
            }
        }

        void WsEnclaveClient::on_message(WsConnectionHdl hdl, WsClientMessagePtr msg) {
            if (msg->get_opcode() != BINDATA_OPCODE) {
                return;  // Ignore non-binary messages
            }

            try {
                byte_vector data(msg->get_payload().begin(), msg->get_payload().end());
                Response response = Response::from_frame(Frame::deserialize(data));

                std::lock_guard<std::mutex> lock(pending_requests_mutex_);
                auto it = pending_requests_.find(response.request_id);
                if (it != pending_requests_.end()) {
                    it->second.set_value(std::move(response));
                    pending_requests_.erase(it);
                } else {
                    LOG_WARN << "Received response for unknown or already handled request ID: "
                             << response.request_id;
                }
            } catch (const std::exception& e) {
                LOG_WARN << "Message processing failed: " << e.what();
            }
        }

        void WsEnclaveClient::run_client() {
            try {
                client_.run();
            } catch (const std::exception& e) {
                LOG_ERROR << "Client thread exception: " << e.what();
            }
        }

    }  // namespace net
}  // namespace CruxEnclave
