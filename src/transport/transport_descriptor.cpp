#include "toolmux/transport/transport_descriptor.hpp"
#include "toolmux/transport/http_transport.hpp"
#include "toolmux/transport/process_transport.hpp"
#include "toolmux/transport/socket_transport.hpp"

#include <type_traits>

namespace toolmux {

std::string describe(const TransportDescriptor& descriptor) {
    return std::visit([](const auto& target) -> std::string {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, SpawnTarget>) {
            return "spawn:" + target.command;
        } else if constexpr (std::is_same_v<T, SocketTarget>) {
            return "socket:" + target.path;
        } else {
            static_assert(std::is_same_v<T, HttpTarget>, "unhandled transport descriptor");
            return "http:" + target.url;
        }
    }, descriptor);
}

std::unique_ptr<IAsyncTransport> make_transport(
    asio::any_io_executor executor,
    const TransportDescriptor& descriptor,
    const TransportOptions& options
) {
    return std::visit([&](const auto& target) -> std::unique_ptr<IAsyncTransport> {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, SpawnTarget>) {
            return std::make_unique<ProcessTransport>(executor, target, options);
        } else if constexpr (std::is_same_v<T, SocketTarget>) {
            return std::make_unique<SocketTransport>(executor, target, options);
        } else {
            static_assert(std::is_same_v<T, HttpTarget>, "unhandled transport descriptor");
            return std::make_unique<HttpTransport>(executor, target, options);
        }
    }, descriptor);
}

}  // namespace toolmux
