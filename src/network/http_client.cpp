#include "tus/network/http_client.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>

namespace tus {
namespace network {

namespace http = beast::http;

// ──────────────────────────────────────────────────────────
// HttpClient Implementation
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
}

Result<HttpResponse> HttpClient::execute(const HttpRequest& request,
                                         std::chrono::milliseconds timeout,
                                         const CancellationToken* cancel) {
    auto url_result = Url::parse(request.url);
    if (url_result.is_error()) {
        return Err<HttpResponse>(url_result.error());
    }
    const Url& url = url_result.value();

    if (url.scheme != "http") {
        return Fail<HttpResponse>(ErrorKind::Configuration,
            "HttpClient supports plain http only: " + request.url);
    }

    const auto verb = to_verb(request.method);
    if (verb == http::verb::unknown) {
        return Fail<HttpResponse>(ErrorKind::Configuration, "Unsupported HTTP method");
    }

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;
    bool done = false;

    const auto cancelled = [&](const std::string& step) {
        spdlog::debug("{} {} cancelled during {}",
                      network::to_string(request.method), request.url, step);
        return Fail<HttpResponse>(ErrorKind::Cancelled,
            step + " cancelled for " + url.to_string());
    };
    const auto abort_stream = [&stream] { stream.cancel(); };

    // ────────────────────────────────────────
    // Resolve (tcp_stream deadlines do not cover the resolver)
    // ────────────────────────────────────────
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(url.host, std::to_string(url.port),
        [&](beast::error_code e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            done = true;
        });
    switch (drive(ioc, done, std::chrono::steady_clock::now() + timeout, cancel,
                  [&resolver] { resolver.cancel(); })) {
        case StepResult::Cancelled: return cancelled("resolve");
        case StepResult::TimedOut: ec = beast::error::timeout; break;
        case StepResult::Completed: break;
    }
    if (ec) {
        return Err<HttpResponse>(transport_error(ec, "resolve", url));
    }

    // ────────────────────────────────────────
    // Connect
    // ────────────────────────────────────────
    done = false;
    stream.expires_after(timeout);
    stream.async_connect(endpoints,
        [&](beast::error_code e, const tcp::endpoint&) { ec = e; done = true; });
    switch (drive(ioc, done, std::chrono::steady_clock::now() + timeout, cancel, abort_stream)) {
        case StepResult::Cancelled: return cancelled("connect");
        case StepResult::TimedOut: ec = beast::error::timeout; break;
        case StepResult::Completed: break;
    }
    if (ec) {
        return Err<HttpResponse>(transport_error(ec, "connect", url));
    }

    // ────────────────────────────────────────
    // Write request
    // ────────────────────────────────────────
    http::request<http::vector_body<uint8_t>> req{verb, url.target, 11};
    req.set(http::field::host, url.host_header());
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    spdlog::debug("{} {} ({} bytes)",
                  network::to_string(request.method), request.url, request.body.size());

    done = false;
    stream.expires_after(timeout);
    http::async_write(stream, req,
        [&](beast::error_code e, std::size_t) { ec = e; done = true; });
    switch (drive(ioc, done, std::chrono::steady_clock::now() + timeout, cancel, abort_stream)) {
        case StepResult::Cancelled: return cancelled("write");
        case StepResult::TimedOut: ec = beast::error::timeout; break;
        case StepResult::Completed: break;
    }
    if (ec) {
        return Err<HttpResponse>(transport_error(ec, "write", url));
    }

    // ────────────────────────────────────────
    // Read response
    // ────────────────────────────────────────
    beast::flat_buffer buffer;
    http::response_parser<http::vector_body<uint8_t>> parser;
    parser.body_limit(kMaxResponseBody);
    if (request.method == HttpMethod::HEAD) {
        parser.skip(true);
    }

    done = false;
    stream.expires_after(timeout);
    http::async_read(stream, buffer, parser,
        [&](beast::error_code e, std::size_t) { ec = e; done = true; });
    switch (drive(ioc, done, std::chrono::steady_clock::now() + timeout, cancel, abort_stream)) {
        case StepResult::Cancelled: return cancelled("read");
        case StepResult::TimedOut: ec = beast::error::timeout; break;
        case StepResult::Completed: break;
    }
    if (ec) {
        return Err<HttpResponse>(transport_error(ec, "read", url));
    }

    auto& res = parser.get();
    HttpResponse response;
    response.status_code = static_cast<int>(res.result_int());
    response.reason_phrase = std::string(res.reason());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(res.body());

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
        spdlog::debug("Shutdown after {} {}: {}",
                      network::to_string(request.method), request.url, shutdown_ec.message());
    }

    spdlog::debug("{} {} -> {} {}",
                  network::to_string(request.method), request.url,
                  response.status_code, response.reason_phrase);
    return Ok(std::move(response));
}

HttpClient::StepResult HttpClient::drive(asio::io_context& ioc,
                                         const bool& done,
                                         std::chrono::steady_clock::time_point deadline,
                                         const CancellationToken* cancel,
                                         const std::function<void()>& abort) {
    StepResult result = StepResult::Completed;
    while (!done) {
        const auto now = std::chrono::steady_clock::now();
        if (cancel != nullptr && cancel->is_cancelled()) {
            result = StepResult::Cancelled;
        } else if (now >= deadline) {
            result = StepResult::TimedOut;
        } else {
            ioc.run_for(std::min<std::chrono::steady_clock::duration>(
                kCancelPollInterval, deadline - now));
            continue;
        }
        abort();
        ioc.run();
        break;
    }
    ioc.restart();
    return result;
}

http::verb HttpClient::to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::PATCH: return http::verb::patch;
        case HttpMethod::HEAD: return http::verb::head;
        case HttpMethod::DELETE_METHOD: return http::verb::delete_;
        case HttpMethod::OPTIONS: return http::verb::options;
        default: return http::verb::unknown;
    }
}

Error HttpClient::transport_error(const beast::error_code& ec,
                                  const std::string& step,
                                  const Url& url) {
    if (ec == beast::error::timeout) {
        return Error(ErrorKind::Transport, step + " timed out for " + url.to_string());
    }
    return Error(ErrorKind::Transport, step + " failed for " + url.to_string() + ": " + ec.message());
}

} // namespace network
} // namespace tus
