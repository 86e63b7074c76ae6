#include "./named_pipe.hpp"

#include "./syserror.hpp"

#if _WIN32

using namespace apipe;

namespace {

bool is_win32_error(const std::error_code& ec, DWORD code) noexcept {
    return ec.category() == std::system_category() && ec.value() == static_cast<int>(code);
}

win32_named_pipe_traits::stream_type adopt_handle(const win32_named_pipe_traits::executor_type& ex,
                                                  HANDLE                                       h,
                                                  std::error_code&                             ec) {
    win32_named_pipe_traits::stream_type stream{ex};
    boost::system::error_code            assign_ec;
    stream.assign(h, assign_ec);
    if (assign_ec) {
        ::CloseHandle(h);
        ec = assign_ec;
        return win32_named_pipe_traits::stream_type{ex};
    }
    ec.clear();
    return stream;
}

}  // namespace

win32_named_pipe_traits::stream_type
win32_named_pipe_traits::create_server(const executor_type&       ex,
                                       const std::string&         name,
                                       const pipe_server_params& params,
                                       std::error_code&           ec) {
    DWORD open_mode = FILE_FLAG_OVERLAPPED | FILE_FLAG_FIRST_PIPE_INSTANCE;
    // Inbound: client to server. Outbound: server to client.
    open_mode |= params.server_writes ? PIPE_ACCESS_OUTBOUND : PIPE_ACCESS_INBOUND;

    DWORD pipe_mode = PIPE_TYPE_BYTE | PIPE_READMODE_BYTE | PIPE_WAIT;
    if (params.reject_remote_clients) {
        pipe_mode |= PIPE_REJECT_REMOTE_CLIENTS;
    }

    HANDLE h = ::CreateNamedPipeA(name.c_str(),
                                  open_mode,
                                  pipe_mode,
                                  1 /* max instances */,
                                  params.buffer_size,
                                  params.buffer_size,
                                  0 /* default timeout */,
                                  nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        ec = get_current_error_code();
        return stream_type{ex};
    }
    return adopt_handle(ex, h, ec);
}

win32_named_pipe_traits::stream_type
win32_named_pipe_traits::open_client(const executor_type& ex,
                                     const std::string&   name,
                                     bool                 client_writes,
                                     std::error_code&     ec) {
    HANDLE h = ::CreateFileA(name.c_str(),
                             client_writes ? GENERIC_WRITE : GENERIC_READ,
                             0,
                             nullptr,
                             OPEN_EXISTING,
                             FILE_FLAG_OVERLAPPED | SECURITY_SQOS_PRESENT | SECURITY_IDENTIFICATION,
                             nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        ec = get_current_error_code();
        return stream_type{ex};
    }
    return adopt_handle(ex, h, ec);
}

bool win32_named_pipe_traits::is_name_collision(const std::error_code& ec) noexcept {
    return is_win32_error(ec, ERROR_ACCESS_DENIED);
}

bool win32_named_pipe_traits::is_remote_rejection_unsupported(const std::error_code& ec) noexcept {
    return is_win32_error(ec, ERROR_INVALID_PARAMETER);
}

bool win32_named_pipe_traits::is_end_of_stream(const boost::system::error_code& ec) noexcept {
    return ec == boost::asio::error::eof
        || (ec.category() == boost::asio::error::get_system_category()
            && ec.value() == static_cast<int>(ERROR_BROKEN_PIPE));
}

#endif
