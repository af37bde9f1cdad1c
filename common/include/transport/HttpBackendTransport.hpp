#pragma once

#include "transport/IBackendTransport.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <memory>
#include <iostream>
#include <string>

namespace cafe::transport {

/**
 * @brief IBackendTransport поверх HTTP клиента (JSON over HTTP)
 *
 * Дедлайн передаётся backend'у в заголовке X-Request-Deadline-Ms
 * (информационно, backend не обязан его учитывать).
 * Сам дедлайн на стороне вызывающего обеспечивает withTimeout().
 */
class HttpBackendTransport : public IBackendTransport {
public:
    static constexpr const char* DEADLINE_HEADER = "X-Request-Deadline-Ms";

    explicit HttpBackendTransport(std::shared_ptr<IHttpClient> httpClient)
        : httpClient_(std::move(httpClient))
    {
        std::cout << "[HttpBackendTransport] Created" << std::endl;
    }

    BackendResponse call(
        const discovery::ServiceAddress& address,
        const BackendRequest& request,
        std::chrono::milliseconds deadline) override
    {
        SimpleRequest httpRequest(
            request.method,
            request.path,
            request.body,
            address.host,
            address.port,
            {}
        );
        for (const auto& [name, value] : request.headers) {
            httpRequest.setHeader(name, value);
        }
        httpRequest.setHeader(DEADLINE_HEADER, std::to_string(deadline.count()));
        if (!request.body.empty()) {
            httpRequest.setHeader("Content-Type", "application/json");
        }

        SimpleResponse httpResponse;
        bool sent = false;
        try {
            sent = httpClient_->send(httpRequest, httpResponse);
        } catch (const std::exception& e) {
            throw TransportError("connection to " + address.toString() + " failed: " + e.what());
        }

        if (!sent || httpResponse.getStatus() == 0) {
            throw TransportError("connection to " + address.toString() + " refused");
        }

        BackendResponse response;
        response.status = httpResponse.getStatus();
        response.body = httpResponse.getBody();
        return response;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
};

} // namespace cafe::transport
