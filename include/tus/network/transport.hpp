#pragma once

#include "tus/core/cancellation.hpp"
#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"

#include <chrono>

namespace tus::network {

/**
 * @brief Capability to execute one HTTP exchange
 *
 * Implementations report connection problems and timeouts as
 * ErrorKind::Transport; any response that arrives, whatever its status,
 * is returned as a value and classified by the protocol layer.
 *
 * When @p cancel is given, cancelling it abandons the exchange in flight
 * and execute() returns ErrorKind::Cancelled without waiting for the
 * server or the timeout.
 *
 * A single Transport may be shared by concurrently running uploads, so
 * execute() must be safe to call from several threads at once.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<HttpResponse> execute(const HttpRequest& request,
                                         std::chrono::milliseconds timeout,
                                         const CancellationToken* cancel = nullptr) = 0;
};

} // namespace tus::network
