#ifndef CRUXENCLAVE_WS_COMMON_HPP
#define CRUXENCLAVE_WS_COMMON_HPP

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <websocketpp/client.hpp>

#include <string>

namespace CruxEnclave {
namespace net {

    // Define types for convenience
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using WsClient = websocketpp::client<websocketpp::config::asio>;
    using WsConnectionHdl = websocketpp::connection_hdl;
    using WsMessagePtr = WsServer::message_ptr;
    using WsClientMessagePtr = WsClient::message_ptr;

    // Define a common binary message type for websocketpp
    const websocketpp::frame::opcode::value BINDATA_OPCODE = websocketpp::frame::opcode::binary;

    // The endpoints above are built without TLS.
    inline bool is_tls_url(const std::string& url) {
        return url.rfind("https://", 0) == 0 || url.rfind("wss://", 0) == 0;
    }

    /**
     * @brief Maps a node URL onto a websocket URI: http:// becomes ws://.
     * Anything else is returned unchanged; callers reject TLS URLs with is_tls_url() first.
     */
    inline std::string to_ws_uri(const std::string& url) {
        if (url.rfind("http://", 0) == 0) {
            return "ws://" + url.substr(7);
        }
        return url;
    }

} // namespace net
} // namespace CruxEnclave

#endif // CRUXENCLAVE_WS_COMMON_HPP
