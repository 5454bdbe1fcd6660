#ifndef CRUXENCLAVE_WS_PEER_TRANSPORT_HPP
#define CRUXENCLAVE_WS_PEER_TRANSPORT_HPP

#include "ws_common.hpp"
#include "transport.hpp"
#include <memory>
#include <thread>

namespace CruxEnclave {
namespace net {

/**
 * @brief PeerTransport over websockets.
 *
 * A perpetual client runs on its own thread. Each push opens a connection to the
 * target node, sends one binary frame and closes; push() only queues the connect
 * and returns. Connection failures are logged.
 */
class WsPeerTransport : public PeerTransport {
public:
    WsPeerTransport();
    ~WsPeerTransport() override;

    void start();
    void stop();

    void push(const EncryptedPayload& envelope, const std::string& url) override;
    void push_party_info(const byte_vector& encoded_party_info, const std::string& url) override;

private:
    void send_frame(const Frame& frame, const std::string& url);

    WsClient client_;
    std::unique_ptr<std::thread> client_thread_;
};

} // namespace net
} // namespace CruxEnclave

#endif // CRUXENCLAVE_WS_PEER_TRANSPORT_HPP
