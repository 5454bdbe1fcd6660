#ifndef CRUXENCLAVE_WS_SERVER_HPP
#define CRUXENCLAVE_WS_SERVER_HPP

#include "ws_common.hpp"
#include "service.hpp"
#include <set>
#include <memory>
#include <mutex>
#include <thread>

namespace CruxEnclave {
namespace net {

/**
 * @brief Accepts websocket connections and feeds every binary frame to an EnclaveService.
 */
class WsEnclaveServer {
public:
    explicit WsEnclaveServer(EnclaveService& service);
    ~WsEnclaveServer();

    /**
     * @brief Starts listening on a background thread.
     */
    void run(uint16_t port);
    void stop();

private:
    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsMessagePtr msg);

    WsServer server_;
    EnclaveService& service_;

    std::mutex connections_mutex_;
    std::set<WsConnectionHdl, std::owner_less<WsConnectionHdl>> connections_;

    std::unique_ptr<std::thread> server_thread_;
};

} // namespace net
} // namespace CruxEnclave

#endif // CRUXENCLAVE_WS_SERVER_HPP
