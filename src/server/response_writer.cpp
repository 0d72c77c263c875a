/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Response writer implementation
 */

#include "server/response_writer.hpp"

#include "http/chunked.hpp"
#include "http/errors.hpp"
#include "util/logger.hpp"

#include <boost/beast/core/string.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace portico::server {

namespace {

bool has_crlf(std::string_view text) {
    return text.find_first_of("\r\n") != std::string_view::npos;
}

} // anonymous namespace

std::string http_date() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[64];
    auto n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buf, n);
}

ResponseWriter::ResponseWriter(net::BufferedStream& stream, const ServerConfig& config)
    : stream_(stream)
    , config_(config)
{
}

void ResponseWriter::prepare(const http::Request& request, bool keep_alive, bool expect_continue) {
    request_body_ = request.body.get();
    response_version_ = request.response_version;
    head_request_ = request.method == "HEAD";
    expect_continue_ = expect_continue;

    status_ = http::Status();
    headers_.clear();
    content_length_.reset();
    written_ = 0;

    started_ = false;
    headers_sent_ = false;
    chunked_ = false;
    continue_sent_ = false;
    close_connection_ = !keep_alive;
}

void ResponseWriter::start(http::Status status, http::Headers headers, std::exception_ptr error) {
    if (started_ && !error) {
        throw http::ProtocolViolation("start_response called a second time without an error");
    }
    if (error && headers_sent_) {
        std::rethrow_exception(error);
    }

    if (status.code < 100 || status.code > 999 || has_crlf(status.reason)) {
        throw http::ProtocolViolation("Invalid response status: " + status.to_string());
    }

    std::optional<std::uint64_t> length;
    for (const auto& [name, value] : headers) {
        if (name.empty() || has_crlf(name) || has_crlf(value)) {
            throw http::ProtocolViolation("Response header contains CR or LF: " + name);
        }
        if (boost::beast::iequals(name, "Content-Length")) {
            auto trimmed = http::trim_ows(value);
            if (trimmed.empty() || trimmed.size() > 19 ||
                !std::all_of(trimmed.begin(), trimmed.end(),
                             [](unsigned char c) { return std::isdigit(c); })) {
                throw http::ProtocolViolation("Invalid Content-Length in response: " + value);
            }
            length = std::stoull(std::string(trimmed));
        }
    }

    status_ = std::move(status);
    headers_ = std::move(headers);
    content_length_ = length;
    started_ = true;
}

void ResponseWriter::write(std::string_view data) {
    if (!started_) {
        throw http::ProtocolViolation("Response body written before start_response");
    }

    bool overrun = content_length_ && written_ + data.size() > *content_length_;
    if (overrun && !headers_sent_) {
        // Nothing committed yet: the connection can still answer 500
        throw http::ProtocolViolation("Response body exceeds the declared Content-Length");
    }

    if (!headers_sent_) {
        send_headers();
    }

    if (overrun) {
        data = data.substr(0, static_cast<std::size_t>(*content_length_ - written_));
    }

    if (!data.empty()) {
        if (!head_request_) {
            if (chunked_) {
                stream_.write(http::encode_chunk(data));
            } else {
                stream_.write(data);
            }
        }
        written_ += data.size();
    }
    stream_.flush();

    if (overrun) {
        close_connection_ = true;
        throw http::ProtocolViolation("Response body exceeds the declared Content-Length");
    }
}

void ResponseWriter::send_body(http::Body& body) {
    while (auto piece = body.next()) {
        if (piece->empty() && headers_sent_) {
            continue;
        }
        write(*piece);
    }
}

void ResponseWriter::finish() {
    if (!started_) {
        throw http::ProtocolViolation("Gateway returned without calling start_response");
    }
    if (!headers_sent_) {
        send_headers();
    }
    if (chunked_ && !head_request_) {
        stream_.write(http::last_chunk);
    }
    if (content_length_ && written_ < *content_length_ && !head_request_) {
        PORTICO_LOG_DEBUG(util::log_component::Connection,
                          "Response body short by {} bytes, closing", *content_length_ - written_);
        close_connection_ = true;
    }
    stream_.flush();
}

void ResponseWriter::simple_response(http::Status status, std::string_view message) {
    close_connection_ = true;
    status_ = status;

    std::string out = fmt::format(
        "HTTP/1.1 {}\r\n"
        "Content-Length: {}\r\n"
        "Content-Type: text/plain\r\n"
        "Connection: close\r\n"
        "Date: {}\r\n"
        "Server: {}\r\n"
        "\r\n",
        status.to_string(), message.size(), http_date(), config_.server_software);
    if (!head_request_) {
        out.append(message);
    }

    stream_.write(out);
    stream_.flush();
    headers_sent_ = true;
    started_ = true;
    written_ = message.size();
}

void ResponseWriter::send_continue() {
    if (continue_sent_ || headers_sent_) {
        return;
    }
    continue_sent_ = true;
    stream_.write("HTTP/1.1 100 Continue\r\n\r\n");
    stream_.flush();
}

void ResponseWriter::settle_request_body() {
    if (!request_body_ || request_body_->finished()) {
        return;
    }
    if (request_body_->failed() || request_body_->discard_requested()) {
        close_connection_ = true;
        return;
    }
    if (expect_continue_ && !request_body_->started()) {
        // The client is still waiting for 100 Continue; never ask for the body
        close_connection_ = true;
        return;
    }

    try {
        request_body_->drain();
    } catch (const http::HttpError& e) {
        PORTICO_LOG_DEBUG(util::log_component::Connection, "Unread request body rejected: {}", e.what());
        close_connection_ = true;
    } catch (const http::ConnectionError& e) {
        PORTICO_LOG_DEBUG(util::log_component::Connection, "Unread request body lost: {}", e.what());
        close_connection_ = true;
    }
}

void ResponseWriter::send_headers() {
    if (status_.code == 413) {
        close_connection_ = true;
    }
    if (headers_.has_token("Connection", "close")) {
        close_connection_ = true;
    }

    bool no_body_status = status_.code < 200 || status_.code == 204 ||
                          status_.code == 205 || status_.code == 304;
    if (headers_.has_token("Transfer-Encoding", "chunked")) {
        chunked_ = true;
    } else if (!content_length_ && !no_body_status) {
        if (response_version_ >= http::http_1_1 && !head_request_) {
            chunked_ = true;
            headers_.add("Transfer-Encoding", "chunked");
        } else {
            close_connection_ = true;
        }
    }

    if (!close_connection_) {
        settle_request_body();
    }

    if (!headers_.contains("Connection")) {
        if (response_version_ >= http::http_1_1) {
            if (close_connection_) {
                headers_.add("Connection", "close");
            }
        } else if (!close_connection_) {
            headers_.add("Connection", "Keep-Alive");
        }
    }
    if (!close_connection_ && headers_.has_token("Connection", "keep-alive") && !headers_.contains("Keep-Alive")) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(config_.keep_alive_timeout).count();
        headers_.add("Keep-Alive", "timeout=" + std::to_string(seconds));
    }

    if (!headers_.contains("Date")) {
        headers_.add("Date", http_date());
    }
    if (!headers_.contains("Server")) {
        headers_.add("Server", config_.server_software);
    }

    std::string head = fmt::format("HTTP/1.1 {}\r\n", status_.to_string());
    for (const auto& [name, value] : headers_) {
        head.append(name).append(": ").append(value).append("\r\n");
    }
    head.append("\r\n");

    stream_.write(head);
    headers_sent_ = true;
}

} // namespace portico::server
