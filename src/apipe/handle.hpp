#pragma once

#include "./endpoint.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/fwd.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <cstddef>
#include <system_error>
#include <utility>
#include <variant>

namespace apipe {

/**
 * @brief One end of an anonymous pipe, backed by either the listening or the connecting end of a
 * named pipe.
 *
 * Callers do not need to know which of the two it holds: every operation is forwarded to whichever
 * endpoint is present. The only exception is connect(), which only the listening end can do.
 *
 * Models Asio's AsyncReadStream and AsyncWriteStream, so the composed operations in
 * boost::asio (async_read(), async_write(), ...) work on it directly.
 *
 * @tparam Traits The backend traits. @see native_named_pipe_traits
 */
template <typename Traits>
class basic_pipe_handle {
public:
    using traits_type        = Traits;
    using server_type        = basic_pipe_server<Traits>;
    using client_type        = basic_pipe_client<Traits>;
    using executor_type      = typename Traits::executor_type;
    using native_handle_type = typename Traits::native_handle_type;

private:
    std::variant<server_type, client_type> _end;

    template <typename Func>
    decltype(auto) _visit(Func&& fn) {
        return std::visit(NEO_FWD(fn), _end);
    }

public:
    /// Wrap the listening end of a pipe
    explicit basic_pipe_handle(server_type&& s) noexcept
        : _end(std::in_place_type<server_type>, NEO_MOVE(s)) {}

    /// Wrap the connecting end of a pipe
    explicit basic_pipe_handle(client_type&& c) noexcept
        : _end(std::in_place_type<client_type>, NEO_MOVE(c)) {}

    /// Whether this handle holds the listening or the connecting end
    [[nodiscard]] pipe_role role() const noexcept {
        return std::holds_alternative<server_type>(_end) ? pipe_role::server : pipe_role::client;
    }

    executor_type get_executor() noexcept {
        return _visit([](auto& end) -> executor_type { return end.get_executor(); });
    }

    /**
     * @brief Obtain the native handle of the pipe. This object keeps ownership of it.
     */
    [[nodiscard]] native_handle_type as_raw_handle() noexcept {
        return _visit([](auto& end) { return end.native_handle(); });
    }

    /**
     * @brief Give up ownership of the native handle and return it to the caller.
     *
     * The handle is neither duplicated nor closed: the caller now owns it exclusively, and this
     * object is left closed.
     */
    [[nodiscard]] native_handle_type into_raw_handle() && {
        return _visit([](auto& end) { return end.release(); });
    }

    /**
     * @brief Wait for the connecting end to open the pipe.
     *
     * Suspends until the peer is observed, which may be indefinitely. Abandoning the coroutine
     * cancels the wait.
     *
     * @pre role() == pipe_role::server
     * @throws std::system_error if the handshake fails
     */
    boost::asio::awaitable<void> connect() {
        neo_assert_always(expects,
                          role() == pipe_role::server,
                          "connect() was called on the connecting end of a pipe. Only the "
                          "listening end has a handshake to perform.");
        boost::system::error_code ec;
        co_await std::get<server_type>(_end).async_connect(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            throw_for_error_code(ec, "Failed to accept the connecting end of an anonymous pipe");
        }
    }

    template <typename MutableBufferSequence, typename ReadToken>
    auto async_read_some(const MutableBufferSequence& buffers, ReadToken&& token) {
        return _visit([&](auto& end) { return end.async_read_some(buffers, NEO_FWD(token)); });
    }

    template <typename ConstBufferSequence, typename WriteToken>
    auto async_write_some(const ConstBufferSequence& buffers, WriteToken&& token) {
        return _visit([&](auto& end) { return end.async_write_some(buffers, NEO_FWD(token)); });
    }

    /**
     * @brief Read *at most* `buf.size()` bytes. Suspends until some data is available.
     *
     * @return std::size_t The number of bytes read. Zero once the writing end has been closed.
     * @throws std::system_error on a read failure
     */
    boost::asio::awaitable<std::size_t> read(boost::asio::mutable_buffer buf) {
        boost::system::error_code ec;
        auto nread = co_await async_read_some(
            buf,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec && !Traits::is_end_of_stream(ec)) {
            throw_for_error_code(ec, "Failed to read from an anonymous pipe");
        }
        co_return nread;
    }

    /**
     * @brief Write *at most* `buf.size()` bytes. Suspends until the pipe accepts some data.
     *
     * @return std::size_t The number of bytes that were written
     * @throws std::system_error on a write failure
     */
    boost::asio::awaitable<std::size_t> write(boost::asio::const_buffer buf) {
        boost::system::error_code ec;
        auto nwritten = co_await async_write_some(
            buf,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            throw_for_error_code(ec, "Failed to write to an anonymous pipe");
        }
        co_return nwritten;
    }

    /// Pipe writes are not buffered in-process, so there is nothing to flush.
    boost::asio::awaitable<void> flush() { co_return; }

    /**
     * @brief Shut down the writing direction.
     *
     * @note On Win32 named pipes this does nothing, and later writes still succeed.
     */
    boost::asio::awaitable<void> shutdown() {
        std::error_code ec;
        _visit([&](auto& end) { end.shutdown(ec); });
        if (ec) {
            throw_for_error_code(ec, "Failed to shut down an anonymous pipe");
        }
        co_return;
    }
};

/**
 * @brief A pipe endpoint that is open for reading
 */
template <typename Traits>
struct basic_pipe_reader : basic_pipe_handle<Traits> {
    using basic_pipe_handle<Traits>::basic_pipe_handle;

private:
    using basic_pipe_handle<Traits>::async_write_some;
    using basic_pipe_handle<Traits>::write;
    using basic_pipe_handle<Traits>::flush;
    using basic_pipe_handle<Traits>::shutdown;
};

/**
 * @brief A pipe endpoint that is open for writing
 */
template <typename Traits>
struct basic_pipe_writer : basic_pipe_handle<Traits> {
    using basic_pipe_handle<Traits>::basic_pipe_handle;

private:
    using basic_pipe_handle<Traits>::async_read_some;
    using basic_pipe_handle<Traits>::read;
};

/**
 * @brief A pipe handle whose connect handshake has not happened yet.
 *
 * The handle is not reachable until connect() succeeds. Destroying a pending_connect closes the
 * endpoint without ever completing the handshake.
 *
 * @tparam Handle The basic_pipe_reader or basic_pipe_writer to produce
 */
template <typename Handle>
class pending_connect {
    Handle _handle;

    static boost::asio::awaitable<Handle> _do_connect(Handle h) {
        co_await h.connect();
        co_return NEO_MOVE(h);
    }

public:
    explicit pending_connect(Handle&& h) noexcept
        : _handle(NEO_MOVE(h)) {}

    /**
     * @brief Perform the handshake and hand over the connected pipe handle.
     *
     * The endpoint moves into the returned awaitable, so this object may be destroyed before the
     * awaitable runs.
     *
     * @throws std::system_error if the handshake fails
     */
    [[nodiscard]] boost::asio::awaitable<Handle> connect() && {
        return _do_connect(NEO_MOVE(_handle));
    }
};

}  // namespace apipe
