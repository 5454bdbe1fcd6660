#ifndef CRUXENCLAVE_WS_CLIENT_HPP
#define CRUXENCLAVE_WS_CLIENT_HPP

#include "ws_common.hpp"
#include "service.hpp"
#include <functional>
#include <thread>
#include <future>
#include <map>
#include <mutex>
#include <atomic>

namespace CruxEnclave {
namespace net {

/**
 * @brief Talks to a node's request op-codes over one websocket connection.
 */
class WsEnclaveClient {
public:
    using OnReadyCallback = std::function<void()>;
    using OnDisconnectCallback = std::function<void()>;

    WsEnclaveClient();
    ~WsEnclaveClient();

    void connect(const std::string& uri);
    void disconnect();
    bool is_connected() const { return is_connected_; }

    /**
     * @brief Asks the node to store a message.
     * @return A future for the response; on success the result holds the digest.
     */
    std::future<Response> store(const byte_vector& message, const std::string& sender,
                                const std::vector<std::string>& recipients);

    /**
     * @return A future for the response; on success the result holds the plaintext.
     */
    std::future<Response> retrieve(const Digest& digest);

    std::future<Response> remove(const Digest& digest);

    void set_on_ready_callback(OnReadyCallback callback);
    void set_on_disconnect_callback(OnDisconnectCallback callback);

private:
    std::future<Response> send_request(uint32_t request_id, const Frame& request);

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_fail(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsClientMessagePtr msg);
    void run_client();
    void fail_pending(const std::string& reason);

    WsClient client_;
    WsConnectionHdl connection_hdl_;
    std::unique_ptr<std::thread> client_thread_;
    std::atomic<bool> is_connected_{false};

    OnReadyCallback on_ready_callback_;
    OnDisconnectCallback on_disconnect_callback_;

    // For request-response mechanism
    std::mutex pending_requests_mutex_;
    std::map<uint32_t, std::promise<Response>> pending_requests_;
    std::atomic<uint32_t> next_request_id_{0};
};

} // namespace net
} // namespace CruxEnclave

#endif // CRUXENCLAVE_WS_CLIENT_HPP
