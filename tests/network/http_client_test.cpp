#include "tus/network/http_client.hpp"
#include "tus/protocol/requests.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using tus::ErrorKind;
using tus::network::HttpClient;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

using RawRequest = http::request<http::string_body>;
using RawResponse = http::response<http::string_body>;

/**
 * Loopback server answering exactly one request on its own thread.
 * With no responder it reads the request and then holds the connection
 * open without answering until the client hangs up.
 */
class OneShotServer {
public:
    explicit OneShotServer(std::function<RawResponse(const RawRequest&)> responder)
        : acceptor_(ioc_, tcp::endpoint(asio::ip::address_v4::loopback(), 0))
        , responder_(std::move(responder)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~OneShotServer() {
        thread_.join();
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + target;
    }

    const RawRequest& received() const { return received_; }

private:
    void serve() {
        beast::error_code ec;
        tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        beast::flat_buffer buffer;
        http::read(socket, buffer, received_, ec);
        if (ec) {
            return;
        }

        if (responder_) {
            auto response = responder_(received_);
            if (received_.method() != http::verb::head) {
                response.prepare_payload();
            }
            http::write(socket, response, ec);
            socket.shutdown(tcp::socket::shutdown_send, ec);
        }

        // Drain until the client closes
        char scratch[256];
        while (!ec) {
            socket.read_some(asio::buffer(scratch), ec);
        }
    }

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::function<RawResponse(const RawRequest&)> responder_;
    RawRequest received_;
    std::thread thread_;
};

} // namespace

TEST(HttpClientTest, PatchSendsHeadersAndBody) {
    OneShotServer server([](const RawRequest&) {
        RawResponse response{http::status::no_content, 11};
        response.set("Tus-Resumable", "1.0.0");
        response.set("Upload-Offset", "5");
        return response;
    });

    HttpClient client("tuscpp-test");
    auto request = tus::protocol::make_patch_request(server.url("/files/1"), 0,
                                                     {'h', 'e', 'l', 'l', 'o'},
                                                     std::nullopt, std::nullopt,
                                                     {{"Authorization", "Bearer t"}});
    auto result = client.execute(request, 5s);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().status_code, 204);
    EXPECT_EQ(result.value().get_header("upload-offset"), "5");

    const auto& received = server.received();
    EXPECT_EQ(received.method(), http::verb::patch);
    EXPECT_EQ(received.target(), "/files/1");
    EXPECT_EQ(received["Content-Type"], "application/offset+octet-stream");
    EXPECT_EQ(received["Upload-Offset"], "0");
    EXPECT_EQ(received["Tus-Resumable"], "1.0.0");
    EXPECT_EQ(received["Authorization"], "Bearer t");
    EXPECT_EQ(received[http::field::user_agent], "tuscpp-test");
    EXPECT_EQ(received.body(), "hello");
}

TEST(HttpClientTest, CreationResponseCarriesLocation) {
    OneShotServer server([](const RawRequest&) {
        RawResponse response{http::status::created, 11};
        response.set(http::field::location, "/files/abc");
        return response;
    });

    HttpClient client;
    auto request = tus::protocol::make_creation_request(server.url("/files/"), 10, false, "", {});
    auto result = client.execute(request, 5s);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().status_code, 201);
    EXPECT_EQ(result.value().get_header("Location"), "/files/abc");
    EXPECT_EQ(server.received()["Upload-Length"], "10");
    EXPECT_EQ(server.received()[http::field::content_length], "0");
}

TEST(HttpClientTest, HeadResponseHasNoBody) {
    OneShotServer server([](const RawRequest&) {
        RawResponse response{http::status::ok, 11};
        response.set("Upload-Offset", "2048");
        response.set("Upload-Length", "10000");
        response.set(http::field::content_length, "10000");
        return response;
    });

    HttpClient client;
    auto result = client.execute(tus::protocol::make_status_request(server.url("/files/1"), {}), 5s);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().status_code, 200);
    EXPECT_EQ(result.value().get_header("Upload-Offset"), "2048");
    EXPECT_TRUE(result.value().body.empty());
}

TEST(HttpClientTest, SilentServerTimesOut) {
    OneShotServer server(nullptr);

    HttpClient client;
    auto result = client.execute(tus::protocol::make_status_request(server.url("/files/1"), {}), 200ms);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Transport);
    EXPECT_NE(result.error().message.find("timed out"), std::string::npos);
}

TEST(HttpClientTest, CancelAbandonsRequestInFlight) {
    OneShotServer server(nullptr);
    tus::CancellationToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });

    HttpClient client;
    const auto start = std::chrono::steady_clock::now();
    auto result = client.execute(tus::protocol::make_status_request(server.url("/files/1"), {}),
                                 10s, &token);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_NE(result.error().message.find("cancelled"), std::string::npos);
    EXPECT_LT(elapsed, 500ms);
}

TEST(HttpClientTest, CancelledTokenStopsBeforeConnecting) {
    tus::CancellationToken token;
    token.cancel();

    HttpClient client;
    auto result = client.execute(
        tus::protocol::make_status_request("http://127.0.0.1:9/files/1", {}), 5s, &token);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
}

TEST(HttpClientTest, ConnectionRefusedIsTransportError) {
    unsigned short port = 0;
    {
        asio::io_context ioc;
        tcp::acceptor reserved(ioc, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        port = reserved.local_endpoint().port();
    }

    HttpClient client;
    auto request = tus::protocol::make_status_request(
        "http://127.0.0.1:" + std::to_string(port) + "/files/1", {});
    auto result = client.execute(request, 2s);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Transport);
}

TEST(HttpClientTest, HttpsIsRejected) {
    HttpClient client;
    auto result = client.execute(tus::protocol::make_status_request("https://tus.test/files/1", {}), 1s);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
}
