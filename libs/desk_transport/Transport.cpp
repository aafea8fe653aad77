#include "Transport.hpp"
#include "Errors.hpp"

#include <utility>

namespace desk_transport {

Transport::Transport(std::shared_ptr<desk_types::Logger> logger)
    : logger_(desk_types::logger_or_null(std::move(logger))) {}

HttpResponse Transport::request(const HttpRequest& request) {
    HttpResponse response = perform(request);
    if (!response.ok()) {
        logger_->error("Transport",
                       std::string("Attempted to connect to ") + https_url(hostname(), request.path) +
                       " with method " + method_name(request.method) +
                       " and got response " + std::to_string(response.status) + ": " + response.body);
        throw desk_types::RequestFailed(response.status, response.body);
    }
    return response;
}

} // namespace desk_transport
