#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#if _WIN32
#include <boost/asio/windows/overlapped_ptr.hpp>
#include <boost/asio/windows/stream_handle.hpp>
#include <windows.h>
#else
#include <boost/asio/posix/stream_descriptor.hpp>
#endif

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace apipe {

/**
 * @brief Creation parameters for the listening end of a named pipe
 */
struct pipe_server_params {
    /// Refuse connections that originate from another host
    bool reject_remote_clients = true;
    /// If `true`, the server end is outbound-only. Otherwise it is inbound-only.
    bool server_writes = false;
    /// Size hint for the in/out buffers of the pipe instance
    std::uint32_t buffer_size = 65536;
};

#if _WIN32

/**
 * @brief Backend traits for Win32 named pipes, driven through the I/O completion port
 *
 * All pipe instances are created with FILE_FLAG_OVERLAPPED, which is the reason named pipes are
 * used at all: the handles returned by ::CreatePipe() do not support overlapped I/O.
 */
struct win32_named_pipe_traits {
    using executor_type      = boost::asio::any_io_executor;
    using stream_type        = boost::asio::windows::stream_handle;
    using native_handle_type = stream_type::native_handle_type;

    /// Create the first and only instance of the pipe `name`
    static stream_type create_server(const executor_type&       ex,
                                     const std::string&         name,
                                     const pipe_server_params& params,
                                     std::error_code&           ec);

    /// Open the client end of the existing pipe `name`
    static stream_type open_client(const executor_type& ex,
                                   const std::string&   name,
                                   bool                 client_writes,
                                   std::error_code&     ec);

    /**
     * @brief Wait for a client to open the pipe (::ConnectNamedPipe())
     *
     * A client that opened the pipe before the wait was issued completes the operation
     * immediately.
     */
    template <typename ConnectToken>
    static auto async_connect(stream_type& server, ConnectToken&& token) {
        return boost::asio::async_initiate<ConnectToken, void(boost::system::error_code)>(
            [&server](auto handler) {
                boost::asio::windows::overlapped_ptr op{
                    server.get_executor(),
                    [h = std::move(handler)](const boost::system::error_code& ec,
                                             std::size_t) mutable { std::move(h)(ec); }};
                BOOL  okay       = ::ConnectNamedPipe(server.native_handle(), op.get());
                DWORD last_error = ::GetLastError();
                if (!okay && last_error == ERROR_PIPE_CONNECTED) {
                    op.complete(boost::system::error_code{}, 0);
                } else if (!okay && last_error != ERROR_IO_PENDING) {
                    boost::system::error_code ec(static_cast<int>(last_error),
                                                 boost::asio::error::get_system_category());
                    op.complete(ec, 0);
                } else {
                    op.release();
                }
            },
            token);
    }

    /// Named pipes have no half-close. This does nothing.
    static void shutdown(stream_type&, std::error_code& ec) noexcept { ec.clear(); }

    /// Relinquish the HANDLE without closing it
    static native_handle_type release(stream_type& s) { return s.release(); }

    /// ERROR_ACCESS_DENIED: an instance with this name already exists
    static bool is_name_collision(const std::error_code& ec) noexcept;
    /// ERROR_INVALID_PARAMETER: PIPE_REJECT_REMOTE_CLIENTS is not accepted here
    static bool is_remote_rejection_unsupported(const std::error_code& ec) noexcept;
    /// The peer closed its end (ERROR_BROKEN_PIPE), or a plain EOF
    static bool is_end_of_stream(const boost::system::error_code& ec) noexcept;
};

using native_named_pipe_traits = win32_named_pipe_traits;

#else

/**
 * @brief Backend traits for platforms without Win32 named pipes.
 *
 * Every operation fails with std::errc::function_not_supported. No pipe can ever be created, so
 * the I/O objects exist only to give the handle types the same shape on every platform.
 */
struct unsupported_named_pipe_traits {
    using executor_type      = boost::asio::any_io_executor;
    using stream_type        = boost::asio::posix::stream_descriptor;
    using native_handle_type = stream_type::native_handle_type;

    static stream_type create_server(const executor_type&       ex,
                                     const std::string&         name,
                                     const pipe_server_params& params,
                                     std::error_code&           ec);

    static stream_type open_client(const executor_type& ex,
                                   const std::string&   name,
                                   bool                 client_writes,
                                   std::error_code&     ec);

    template <typename ConnectToken>
    static auto async_connect(stream_type& server, ConnectToken&& token) {
        return boost::asio::async_initiate<ConnectToken, void(boost::system::error_code)>(
            [&server](auto handler) {
                boost::asio::post(server.get_executor(), [h = std::move(handler)]() mutable {
                    std::move(h)(boost::asio::error::operation_not_supported);
                });
            },
            token);
    }

    static void shutdown(stream_type& s, std::error_code& ec) noexcept;

    static native_handle_type release(stream_type& s) { return s.release(); }

    static bool is_name_collision(const std::error_code&) noexcept { return false; }
    static bool is_remote_rejection_unsupported(const std::error_code&) noexcept { return false; }
    static bool is_end_of_stream(const boost::system::error_code& ec) noexcept {
        return ec == boost::asio::error::eof;
    }
};

using native_named_pipe_traits = unsupported_named_pipe_traits;

#endif

}  // namespace apipe
