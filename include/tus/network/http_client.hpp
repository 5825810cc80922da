#pragma once

#include "tus/network/transport.hpp"
#include "tus/network/url.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace tus {
namespace network {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

/**
 * @brief Plain-HTTP Transport built on Boost.Beast
 *
 * Every execute() call owns its io_context, resolver and stream, runs the
 * exchange to completion and closes the connection, so one HttpClient can
 * be shared by any number of concurrent uploads.
 *
 * Deadlines:
 * Each step (resolve, connect, write, read) is an async operation driven
 * on the private io_context; beast::tcp_stream cancels the step when the
 * per-request timeout expires and the failure is reported as a Transport
 * error with "timed out" in the message.
 *
 * Cancellation:
 * The io_context is run in kCancelPollInterval slices. When the token
 * fires between slices the pending step is cancelled, its handler drained
 * and execute() returns ErrorKind::Cancelled.
 *
 * Limitations:
 * - https:// URLs are rejected (no TLS layer)
 * - response bodies above kMaxResponseBody are treated as transport errors
 */
class HttpClient : public Transport {
public:
    static constexpr std::size_t kMaxResponseBody = 1024 * 1024;
    static constexpr std::chrono::milliseconds kCancelPollInterval{20};

    explicit HttpClient(std::string user_agent = "tuscpp/1.0");

    Result<HttpResponse> execute(const HttpRequest& request,
                                 std::chrono::milliseconds timeout,
                                 const CancellationToken* cancel = nullptr) override;

private:
    enum class StepResult { Completed, TimedOut, Cancelled };

    /**
     * @brief Run @p ioc until @p done is set, the deadline passes or @p cancel fires
     *
     * On timeout or cancellation @p abort is invoked and the aborted
     * handler is drained before returning.
     */
    static StepResult drive(asio::io_context& ioc,
                            const bool& done,
                            std::chrono::steady_clock::time_point deadline,
                            const CancellationToken* cancel,
                            const std::function<void()>& abort);

    static beast::http::verb to_verb(HttpMethod method);

    static Error transport_error(const beast::error_code& ec,
                                 const std::string& step,
                                 const Url& url);

    std::string user_agent_;
};

} // namespace network
} // namespace tus
