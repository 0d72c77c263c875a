/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Body reader - Lazy request body access for length-delimited and chunked framing
 */

#ifndef PORTICO_HTTP_BODY_READER_HPP
#define PORTICO_HTTP_BODY_READER_HPP

#include "http/headers.hpp"
#include "net/buffered_stream.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace portico::http {

/**
 * Request body stream handed to the gateway
 *
 * Reads are pulled from the connection only when the gateway asks. A reader
 * that throws once is marked failed; every later read fails too and the
 * connection is closed after the response.
 */
class BodyReader {
public:
    static constexpr std::size_t default_read_size = 8192;

    virtual ~BodyReader() = default;

    BodyReader(const BodyReader&) = delete;
    BodyReader& operator=(const BodyReader&) = delete;

    /**
     * Read up to `max_bytes` of payload
     * @return Empty string once the body is complete
     * @throws BadRequest, PayloadTooLarge, UnexpectedEof, ConnectionError
     */
    std::string read(std::size_t max_bytes = default_read_size);

    /**
     * Read the remainder of the body
     */
    std::string read_all();

    /**
     * Tell the connection the gateway does not want the rest of the body
     */
    void discard() noexcept { discard_requested_ = true; }
    bool discard_requested() const noexcept { return discard_requested_; }

    /**
     * Consume and drop whatever the gateway left unread
     */
    void drain();

    virtual bool finished() const noexcept = 0;
    bool failed() const noexcept { return failed_; }
    bool started() const noexcept { return started_; }

    /**
     * Payload bytes handed out so far (chunk framing excluded)
     */
    std::uint64_t bytes_consumed() const noexcept { return consumed_; }

    /**
     * Invoked once, right before the first read touches the socket
     * (used to send "100 Continue")
     */
    void on_first_read(std::function<void()> hook) { first_read_hook_ = std::move(hook); }

    /**
     * Trailer fields of a chunked body, available once finished()
     */
    virtual const Headers& trailers() const noexcept;

    virtual bool is_chunked() const noexcept { return false; }

protected:
    BodyReader() = default;

    /**
     * Read up to `max_bytes`; only called while !finished()
     */
    virtual std::string do_read(std::size_t max_bytes) = 0;

private:
    std::function<void()> first_read_hook_;
    std::uint64_t consumed_{0};
    bool started_{false};
    bool failed_{false};
    bool discard_requested_{false};
};

/**
 * Request without a body
 */
class EmptyBody final : public BodyReader {
public:
    bool finished() const noexcept override { return true; }

protected:
    std::string do_read(std::size_t) override { return {}; }
};

/**
 * Exactly Content-Length bytes
 */
class LengthBodyReader final : public BodyReader {
public:
    LengthBodyReader(net::BufferedStream& stream, std::uint64_t length);

    bool finished() const noexcept override { return remaining_ == 0; }
    std::uint64_t remaining() const noexcept { return remaining_; }

protected:
    std::string do_read(std::size_t max_bytes) override;

private:
    net::BufferedStream& stream_;
    std::uint64_t remaining_;
};

/**
 * Transfer-Encoding: chunked
 */
class ChunkedBodyReader final : public BodyReader {
public:
    /**
     * @param max_body_size Payload limit, 0 for unlimited
     * @param max_line_size Limit for a size line and for the trailer section
     */
    ChunkedBodyReader(net::BufferedStream& stream, std::uint64_t max_body_size,
                      std::size_t max_line_size);

    bool finished() const noexcept override { return done_; }
    const Headers& trailers() const noexcept override { return trailers_; }
    bool is_chunked() const noexcept override { return true; }

protected:
    std::string do_read(std::size_t max_bytes) override;

private:
    /**
     * Advance to the next chunk with data
     * @return false after the last chunk and trailers
     */
    bool next_chunk();
    void expect_crlf();
    void read_trailers();

    net::BufferedStream& stream_;
    std::uint64_t max_body_size_;
    std::size_t max_line_size_;

    std::uint64_t chunk_remaining_{0};
    std::uint64_t declared_total_{0};
    bool done_{false};
    Headers trailers_;
};

} // namespace portico::http

#endif // PORTICO_HTTP_BODY_READER_HPP
