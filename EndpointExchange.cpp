//
// Created by jonas on 09.03.21.
//

#include "EndpointExchange.hpp"
#include "Log.hpp"

#include <optional>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    template<typename Message>
    void setJsonBody(Message &message, const nlohmann::json &body) {
        message.set(http::field::content_type, "application/json");
        message.body() = body.dump();
        message.prepare_payload();
    }

    /// Peer's info if the request is a well formed exchange, otherwise the status to reject it with
    std::optional<ConnectionInfo> parseRequest(const Request &req, http::status &rejection) {
        if (req.method() != http::verb::post or req.target() != EXCHANGE_PATH) {
            rejection = http::status::not_found;
            return std::nullopt;
        }
        auto theirs = parseConnectionInfo(req.body());
        if (not theirs) {
            rejection = http::status::bad_request;
        }
        return theirs;
    }

    /// Answers one request, returns the peer's info if it was a valid exchange
    std::optional<ConnectionInfo> handleConnection(tcp::socket &socket, const ConnectionInfo &mine) {
        beast::flat_buffer buffer;
        Request req;
        http::read(socket, buffer, req);

        auto status = http::status::ok;
        auto theirs = parseRequest(req, status);

        Response res{status, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        if (theirs) {
            setJsonBody(res, mine);
        } else {
            res.prepare_payload();
        }
        http::write(socket, res);

        beast::error_code ec;
        auto peer = socket.remote_endpoint(ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
        if (theirs) {
            logDebug("exchanged connection info with {}", peer.address().to_string());
        } else {
            auto target = req.target();
            logWarning("rejected request for {} from {} ({})", std::string(target.data(), target.size()),
                       peer.address().to_string(), static_cast<unsigned>(status));
        }
        return theirs;
    }
}

std::optional<ConnectionInfo> parseConnectionInfo(const std::string &body) {
    try {
        return nlohmann::json::parse(body).get<ConnectionInfo>();
    } catch (const nlohmann::json::exception &e) {
        logWarning("malformed connection info: {}", e.what());
        return std::nullopt;
    }
}

ConnectionInfo serveConnectionInfo(unsigned short port, const ConnectionInfo &mine) {
    net::io_context ioc{1};
    tcp::acceptor acceptor{ioc, {net::ip::make_address("0.0.0.0"), port}};
    logInfo("waiting for peer on port {}", port);

    while (true) {
        tcp::socket socket{ioc};
        acceptor.accept(socket);
        try {
            if (auto theirs = handleConnection(socket, mine)) {
                return *theirs;
            }
        } catch (const beast::system_error &e) {
            // The peer went away mid request, wait for the next one
            logWarning("dropped exchange connection: {}", e.code().message());
        }
    }
}

ConnectionInfo requestConnectionInfo(const std::string &host, const std::string &port, const ConnectionInfo &mine) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve(host, port));

    Request req{http::verb::post, EXCHANGE_PATH, 11};
    req.set(http::field::host, host);
    setJsonBody(req, mine);
    http::write(stream, req);

    beast::flat_buffer buffer;
    Response res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec and ec != beast::errc::not_connected) {
        logWarning("shutting down connection to {}:{}: {}", host, port, ec.message());
    }

    if (res.result() != http::status::ok) {
        throw beast::system_error(beast::error_code(static_cast<int>(res.result()), beast::generic_category()),
                                  "Endpoint exchange rejected by " + host);
    }
    logDebug("exchanged connection info with {}:{}", host, port);
    return nlohmann::json::parse(res.body()).get<ConnectionInfo>();
}
