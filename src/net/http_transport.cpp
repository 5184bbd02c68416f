#include "chunkflow/net/http_transport.hpp"
#include "chunkflow/net/http_response_parser.hpp"
#include "chunkflow/net/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <functional>

namespace chunkflow {
namespace net {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;

namespace {

using Completion = std::function<void(const boost::system::error_code&, std::size_t)>;

struct StepResult {
    boost::system::error_code ec;
    std::size_t bytes = 0;
    bool timed_out = false;
};

/**
 * @brief One client connection, driven step by step
 *
 * Each call starts one async operation on the private io_context and runs
 * the context for at most the step's timeout. Callers see a blocking API;
 * the deadline is enforced by closing the socket.
 */
class Connection {
public:
    Connection(const Url& url, const HttpTransportOptions& options)
        : url_(url),
          options_(options),
          ssl_context_(ssl::context::tls_client),
          socket_(io_) {}

    ~Connection() { close(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Result<void> open() {
        tcp::resolver resolver(io_);
        tcp::resolver::results_type endpoints;

        auto resolved = run(options_.connect_timeout, [&](Completion done) {
            resolver.async_resolve(url_.host, std::to_string(url_.port),
                [&endpoints, done](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                    endpoints = std::move(results);
                    done(ec, 0);
                });
        }, [&resolver]() { resolver.cancel(); });
        if (auto res = check(resolved, "resolve " + url_.host, options_.connect_timeout); res.is_error()) {
            return Err<void>(res.error());
        }

        if (url_.is_tls()) {
            if (auto res = prepare_tls(); res.is_error()) {
                return res;
            }
        }

        auto connected = run(options_.connect_timeout, [&](Completion done) {
            asio::async_connect(lowest(), endpoints,
                [done](const boost::system::error_code& ec, const tcp::endpoint&) {
                    done(ec, 0);
                });
        });
        if (auto res = check(connected, "connect to " + url_.host_header(), options_.connect_timeout); res.is_error()) {
            return Err<void>(res.error());
        }

        if (tls_) {
            auto shaken = run(options_.connect_timeout, [&](Completion done) {
                tls_->async_handshake(ssl::stream_base::client,
                    [done](const boost::system::error_code& ec) {
                        done(ec, 0);
                    });
            });
            if (auto res = check(shaken, "TLS handshake with " + url_.host, options_.connect_timeout); res.is_error()) {
                return Err<void>(res.error());
            }
        }
        return Ok();
    }

    Result<void> write(const void* data, std::size_t len) {
        auto written = run(options_.read_timeout, [&](Completion done) {
            if (tls_) {
                asio::async_write(*tls_, asio::buffer(data, len), done);
            } else {
                asio::async_write(socket_, asio::buffer(data, len), done);
            }
        });
        if (auto res = check(written, "send", options_.read_timeout); res.is_error()) {
            return Err<void>(res.error());
        }
        return Ok();
    }

    /// Returns 0 once the peer has closed the connection.
    Result<std::size_t> read_some(char* buffer, std::size_t len) {
        auto received = run(options_.read_timeout, [&](Completion done) {
            if (tls_) {
                tls_->async_read_some(asio::buffer(buffer, len), done);
            } else {
                socket_.async_read_some(asio::buffer(buffer, len), done);
            }
        });
        if (received.ec == asio::error::eof || received.ec == ssl::error::stream_truncated) {
            return Ok<std::size_t>(0);
        }
        return check(received, "receive", options_.read_timeout);
    }

    void close() {
        boost::system::error_code ignored;
        lowest().shutdown(tcp::socket::shutdown_both, ignored);
        lowest().close(ignored);
    }

private:
    tcp::socket& lowest() { return tls_ ? tls_->next_layer() : socket_; }

    Result<void> prepare_tls() {
        boost::system::error_code ec;
        if (options_.verify_tls) {
            ssl_context_.set_default_verify_paths(ec);
            if (ec) {
                return Err<void>("Failed to load CA certificates: " + ec.message());
            }
            ssl_context_.set_verify_mode(ssl::verify_peer);
        } else {
            ssl_context_.set_verify_mode(ssl::verify_none);
        }

        tls_ = std::make_unique<ssl::stream<tcp::socket>>(io_, ssl_context_);
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
            return Err<void>("Failed to set TLS server name for " + url_.host);
        }
        if (options_.verify_tls) {
            tls_->set_verify_callback(ssl::host_name_verification(url_.host));
        }
        return Ok();
    }

    template<typename Start>
    StepResult run(std::chrono::seconds timeout, Start&& start, const std::function<void()>& cancel = {}) {
        StepResult result;
        bool done = false;
        start(Completion([&result, &done](const boost::system::error_code& ec, std::size_t n) {
            result.ec = ec;
            result.bytes = n;
            done = true;
        }));

        io_.restart();
        io_.run_for(timeout);
        if (!done) {
            result.timed_out = true;
            if (cancel) {
                cancel();
            } else {
                close();
            }
            // Let the aborted handler run before its captures go out of scope.
            io_.restart();
            io_.run();
        }
        return result;
    }

    static Result<std::size_t> check(const StepResult& step, const std::string& what, std::chrono::seconds timeout) {
        if (step.timed_out) {
            return Err<std::size_t>(what + " timed out after " + std::to_string(timeout.count()) + "s");
        }
        if (step.ec) {
            return Err<std::size_t>(what + " failed: " + step.ec.message());
        }
        return Ok(step.bytes);
    }

    const Url& url_;
    const HttpTransportOptions& options_;
    asio::io_context io_;
    ssl::context ssl_context_;
    tcp::socket socket_;
    std::unique_ptr<ssl::stream<tcp::socket>> tls_;
};

Result<transfer::TransportResponse> read_response(Connection& connection, HttpMethod method) {
    HttpResponseParser parser(method);
    std::array<char, 8192> buffer;

    while (true) {
        auto received = connection.read_some(buffer.data(), buffer.size());
        if (received.is_error()) {
            return Err<transfer::TransportResponse>(received.error());
        }

        auto parsed = received.value() == 0
            ? parser.finish()
            : parser.parse(buffer.data(), received.value());
        if (parsed.is_error()) {
            return Err<transfer::TransportResponse>(parsed.error());
        }
        if (parsed.value()) {
            break;
        }
    }

    HttpResponse response = parser.take_response();
    transfer::TransportResponse result;
    result.status_code = response.status_code;
    result.body = std::move(response.body);
    for (auto& [name, value] : response.headers) {
        result.headers[name] = value;
    }
    return Ok(std::move(result));
}

} // namespace

std::string base64_encode(const std::string& input) {
    static const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        const uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                           (static_cast<uint8_t>(input[i + 1]) << 8) |
                           static_cast<uint8_t>(input[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    const std::size_t rest = input.size() - i;
    if (rest == 1) {
        const uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                           (static_cast<uint8_t>(input[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

Result<std::unique_ptr<HttpTransport>> HttpTransport::create(HttpTransportOptions options) {
    auto base = parse_url(options.base_url);
    if (base.is_error()) {
        return Err<std::unique_ptr<HttpTransport>>(base.error());
    }
    return Ok(std::unique_ptr<HttpTransport>(new HttpTransport(std::move(options), base.take())));
}

HttpTransport::HttpTransport(HttpTransportOptions options, Url base)
    : options_(std::move(options)),
      base_(std::move(base)) {}

std::string HttpTransport::describe() const {
    Url root = base_;
    root.path = join_path(base_.path, options_.path_prefix);
    return root.to_string();
}

std::string HttpTransport::target_for(const std::string& destination) const {
    return join_path(join_path(base_.path, encode_path(options_.path_prefix)), encode_path(destination));
}

std::string HttpTransport::url_for(const std::string& destination) const {
    Url url = base_;
    url.path = target_for(destination);
    return url.to_string();
}

std::string HttpTransport::authorization() const {
    return "Basic " + base64_encode(options_.username + ":" + options_.password);
}

Result<transfer::TransportResponse> HttpTransport::put_stream(const std::string& destination,
                                                              transfer::ChunkStream& body,
                                                              const transfer::HeaderMap& headers,
                                                              std::uint64_t content_length) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.target = target_for(destination);
    for (const auto& [name, value] : headers) {
        request.set_header(name, value);
    }
    request.set_header("Host", base_.host_header());
    request.set_header("User-Agent", options_.user_agent);
    request.set_header("Content-Length", std::to_string(content_length));
    request.set_header("Connection", "close");
    if (!options_.username.empty()) {
        request.set_header("Authorization", authorization());
    }

    spdlog::debug("PUT {} ({} bytes, chunk {} bytes)", url_for(destination), content_length, body.chunk_size());

    Connection connection(base_, options_);
    if (auto res = connection.open(); res.is_error()) {
        return Err<transfer::TransportResponse>(res.error());
    }

    const std::string head = request.serialize_head();
    auto sent_head = connection.write(head.data(), head.size());

    std::uint64_t sent = 0;
    Result<void> send_result = sent_head;
    if (send_result.is_ok()) {
        transfer::Chunk chunk;
        while (true) {
            auto more = body.next(chunk);
            if (more.is_error()) {
                return Err<transfer::TransportResponse>(more.error());
            }
            if (!more.value()) {
                break;
            }
            if (sent + chunk.size > content_length) {
                return Err<transfer::TransportResponse>(
                    "Source grew beyond the declared Content-Length of " + std::to_string(content_length) + " bytes");
            }
            send_result = connection.write(chunk.data, chunk.size);
            if (send_result.is_error()) {
                break;
            }
            sent += chunk.size;
        }
    }

    if (send_result.is_ok() && sent != content_length) {
        return Err<transfer::TransportResponse>(
            "Source ended after " + std::to_string(sent) + " of " + std::to_string(content_length) + " bytes");
    }

    // A server may answer (401, 413, ...) and close before the body is complete.
    auto response = read_response(connection, HttpMethod::PUT);
    if (send_result.is_error()) {
        if (response.is_ok()) {
            spdlog::debug("Server replied {} before the upload finished", response.value().status_code);
            return response;
        }
        return Err<transfer::TransportResponse>(send_result.error());
    }
    return response;
}

Result<transfer::TransportResponse> HttpTransport::head(const std::string& destination) {
    HttpRequest request;
    request.method = HttpMethod::HEAD;
    request.target = target_for(destination);
    request.set_header("Host", base_.host_header());
    request.set_header("User-Agent", options_.user_agent);
    request.set_header("Connection", "close");
    if (!options_.username.empty()) {
        request.set_header("Authorization", authorization());
    }

    spdlog::debug("HEAD {}", url_for(destination));

    Connection connection(base_, options_);
    if (auto res = connection.open(); res.is_error()) {
        return Err<transfer::TransportResponse>(res.error());
    }

    const std::string head_bytes = request.serialize_head();
    if (auto res = connection.write(head_bytes.data(), head_bytes.size()); res.is_error()) {
        return Err<transfer::TransportResponse>(res.error());
    }
    return read_response(connection, HttpMethod::HEAD);
}

} // namespace net
} // namespace chunkflow
