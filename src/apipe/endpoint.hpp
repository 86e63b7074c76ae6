#pragma once

#include <neo/fwd.hpp>

#include <cstddef>
#include <system_error>
#include <utility>

namespace apipe {

/// Which side of a named pipe an endpoint is
enum class pipe_role {
    /// The listening side: created first, performs the connect handshake
    server,
    /// The connecting side: opened by name against an existing server
    client,
};

/**
 * @brief One end of a named pipe, owning the underlying I/O object.
 *
 * @tparam Traits The backend traits, providing the I/O object type and its operations
 * @tparam Role Whether this is the listening or the connecting end. Only servers can accept a
 * connection.
 */
template <typename Traits, pipe_role Role>
class basic_pipe_endpoint {
public:
    using traits_type        = Traits;
    using stream_type        = typename Traits::stream_type;
    using executor_type      = typename Traits::executor_type;
    using native_handle_type = typename Traits::native_handle_type;

    static constexpr pipe_role role = Role;

private:
    stream_type _stream;

public:
    /// Take ownership of an opened I/O object
    explicit basic_pipe_endpoint(stream_type&& s) noexcept
        : _stream(NEO_MOVE(s)) {}

    basic_pipe_endpoint(basic_pipe_endpoint&&) noexcept = default;
    basic_pipe_endpoint& operator=(basic_pipe_endpoint&&) noexcept = default;

    executor_type get_executor() noexcept { return _stream.get_executor(); }

    /// Obtain the native handle. Ownership is retained by this object.
    [[nodiscard]] native_handle_type native_handle() noexcept { return _stream.native_handle(); }

    /**
     * @brief Relinquish ownership of the native handle and return it to the caller.
     *
     * @note The endpoint is left closed. It is the duty of the caller to close the returned handle.
     */
    [[nodiscard]] native_handle_type release() { return Traits::release(_stream); }

    template <typename MutableBufferSequence, typename ReadToken>
    auto async_read_some(const MutableBufferSequence& buffers, ReadToken&& token) {
        return _stream.async_read_some(buffers, NEO_FWD(token));
    }

    template <typename ConstBufferSequence, typename WriteToken>
    auto async_write_some(const ConstBufferSequence& buffers, WriteToken&& token) {
        return _stream.async_write_some(buffers, NEO_FWD(token));
    }

    /// Wait for the connecting end to open the pipe
    template <typename ConnectToken>
    requires(Role == pipe_role::server)  //
        auto async_connect(ConnectToken&& token) {
        return Traits::async_connect(_stream, NEO_FWD(token));
    }

    void shutdown(std::error_code& ec) noexcept { Traits::shutdown(_stream, ec); }
};

template <typename Traits>
using basic_pipe_server = basic_pipe_endpoint<Traits, pipe_role::server>;

template <typename Traits>
using basic_pipe_client = basic_pipe_endpoint<Traits, pipe_role::client>;

}  // namespace apipe
