#include "cruxenclave/ws_common.hpp"

#include <gtest/gtest.h>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/errors.hpp"
#include "cruxenclave/ws_client.hpp"
#include "cruxenclave/ws_peer_transport.hpp"

TEST(WsCommonTest, PlainUrlsMapToWebsocketUris) {
    ASSERT_EQ(CruxEnclave::net::to_ws_uri("http://127.0.0.1:9000"), "ws://127.0.0.1:9000");
    ASSERT_EQ(CruxEnclave::net::to_ws_uri("ws://node-b:9000/"), "ws://node-b:9000/");
    ASSERT_FALSE(CruxEnclave::net::is_tls_url("http://node-b"));
    ASSERT_FALSE(CruxEnclave::net::is_tls_url("ws://node-b"));
}

TEST(WsCommonTest, TlsUrlsAreRecognized) {
    ASSERT_TRUE(CruxEnclave::net::is_tls_url("https://node-b:9000"));
    ASSERT_TRUE(CruxEnclave::net::is_tls_url("wss://node-b:9000"));
    // Never rewritten to a TLS scheme
    ASSERT_EQ(CruxEnclave::net::to_ws_uri("https://node-b:9000"), "https://node-b:9000");
}

TEST(WsCommonTest, TlsPeersAreSkipped) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::net::WsPeerTransport transport;
    transport.start();
    ASSERT_NO_THROW(transport.push_party_info({0x00}, "https://node-b:9000"));
    transport.stop();

    CruxEnclave::net::WsEnclaveClient client;
    ASSERT_THROW(client.connect("https://node-b:9000"), CruxEnclave::InvalidArgument);
    ASSERT_FALSE(client.is_connected());
}
