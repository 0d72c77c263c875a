/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Test support - blocking HTTP client with timeouts
 */

#ifndef PORTICO_TESTS_TEST_CLIENT_HPP
#define PORTICO_TESTS_TEST_CLIENT_HPP

#include <utility>  // Boost.Asio awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace portico::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

using Response = bhttp::response<bhttp::string_body>;

/**
 * Async operations driven by run_for so a misbehaving server fails the
 * test instead of hanging it
 */
template<typename Stream>
class BasicClient {
public:
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};

    void send(std::string_view data) {
        boost::system::error_code result;
        run([&] {
            asio::async_write(stream(), asio::buffer(data.data(), data.size()),
                              [&](const boost::system::error_code& ec, std::size_t) { result = ec; });
        });
        if (result) {
            throw std::runtime_error("send failed: " + result.message());
        }
    }

    /**
     * Read one response; `head` for responses to HEAD requests
     */
    Response read_response(bool head = false) {
        bhttp::response_parser<bhttp::string_body> parser;
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());
        parser.skip(head);
        boost::system::error_code result;
        run([&] {
            bhttp::async_read(stream(), buffer_, parser,
                              [&](const boost::system::error_code& ec, std::size_t) { result = ec; });
        });
        if (result) {
            throw std::runtime_error("read failed: " + result.message());
        }
        return parser.release();
    }

    Response request(std::string_view raw, bool head = false) {
        send(raw);
        return read_response(head);
    }

    /**
     * Everything until the server closes; throws if it does not close in time
     */
    std::string read_until_close() {
        std::string out = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        while (true) {
            char block[4096];
            boost::system::error_code result;
            std::size_t n = 0;
            run([&] {
                stream().async_read_some(asio::buffer(block),
                                         [&](const boost::system::error_code& ec, std::size_t count) {
                                             result = ec;
                                             n = count;
                                         });
            });
            out.append(block, n);
            if (result) {
                return out;
            }
        }
    }

    /**
     * True if the server closed the connection without sending anything
     */
    bool closed_silently() {
        return read_until_close().empty();
    }

protected:
    virtual ~BasicClient() = default;
    virtual Stream& stream() = 0;
    virtual void cancel() = 0;

    template<typename Start>
    void run(Start start) {
        io_.restart();
        start();
        io_.run_for(timeout);
        if (!io_.stopped()) {
            cancel();
            io_.run();
            throw std::runtime_error("operation timed out");
        }
    }

    asio::io_context io_;
    beast::flat_buffer buffer_;
};

/**
 * Plain client over TCP or a Unix domain socket
 */
class TestClient final : public BasicClient<asio::generic::stream_protocol::socket> {
public:
    explicit TestClient(std::uint16_t port)
        : socket_(io_)
    {
        connect(asio::generic::stream_protocol::endpoint(
            asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port)));
    }

    explicit TestClient(const std::string& unix_path)
        : socket_(io_)
    {
        connect(asio::generic::stream_protocol::endpoint(asio::local::stream_protocol::endpoint(unix_path)));
    }

    ~TestClient() override {
        boost::system::error_code ec;
        socket_.close(ec);
    }

    void shutdown_send() {
        socket_.shutdown(asio::socket_base::shutdown_send);
    }

protected:
    asio::generic::stream_protocol::socket& stream() override { return socket_; }
    void cancel() override {
        boost::system::error_code ec;
        socket_.cancel(ec);
    }

private:
    void connect(const asio::generic::stream_protocol::endpoint& endpoint) {
        boost::system::error_code result;
        run([&] {
            socket_.async_connect(endpoint, [&](const boost::system::error_code& ec) { result = ec; });
        });
        if (result) {
            throw std::runtime_error("connect failed: " + result.message());
        }
    }

    asio::generic::stream_protocol::socket socket_;
};

/**
 * TLS client that accepts any server certificate
 */
class TlsTestClient final : public BasicClient<asio::ssl::stream<asio::ip::tcp::socket>> {
public:
    explicit TlsTestClient(std::uint16_t port)
        : ssl_context_(asio::ssl::context::tls_client)
        , stream_(io_, ssl_context_)
    {
        ssl_context_.set_verify_mode(asio::ssl::verify_none);

        boost::system::error_code result;
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);
        run([&] {
            stream_.next_layer().async_connect(endpoint, [&](const boost::system::error_code& ec) { result = ec; });
        });
        if (result) {
            throw std::runtime_error("connect failed: " + result.message());
        }
    }

    /**
     * @return the handshake error, empty on success
     */
    boost::system::error_code handshake() {
        boost::system::error_code result;
        run([&] {
            stream_.async_handshake(asio::ssl::stream_base::client,
                                    [&](const boost::system::error_code& ec) { result = ec; });
        });
        return result;
    }

    /**
     * Write raw bytes under the TLS layer
     */
    void send_plain(std::string_view data) {
        boost::system::error_code result;
        run([&] {
            asio::async_write(stream_.next_layer(), asio::buffer(data.data(), data.size()),
                              [&](const boost::system::error_code& ec, std::size_t) { result = ec; });
        });
        if (result) {
            throw std::runtime_error("send failed: " + result.message());
        }
    }

    std::string read_plain_until_close() {
        std::string out;
        while (true) {
            char block[4096];
            boost::system::error_code result;
            std::size_t n = 0;
            run([&] {
                stream_.next_layer().async_read_some(
                    asio::buffer(block), [&](const boost::system::error_code& ec, std::size_t count) {
                        result = ec;
                        n = count;
                    });
            });
            out.append(block, n);
            if (result) {
                return out;
            }
        }
    }

    ~TlsTestClient() override {
        boost::system::error_code ec;
        stream_.next_layer().close(ec);
    }

protected:
    asio::ssl::stream<asio::ip::tcp::socket>& stream() override { return stream_; }
    void cancel() override {
        boost::system::error_code ec;
        stream_.next_layer().cancel(ec);
    }

private:
    asio::ssl::context ssl_context_;
    asio::ssl::stream<asio::ip::tcp::socket> stream_;
};

} // namespace portico::test

#endif // PORTICO_TESTS_TEST_CLIENT_HPP
