#include "./named_pipe.hpp"

#if !_WIN32

using namespace apipe;

unsupported_named_pipe_traits::stream_type
unsupported_named_pipe_traits::create_server(const executor_type& ex,
                                             const std::string&,
                                             const pipe_server_params&,
                                             std::error_code& ec) {
    ec = std::make_error_code(std::errc::function_not_supported);
    return stream_type{ex};
}

unsupported_named_pipe_traits::stream_type
unsupported_named_pipe_traits::open_client(const executor_type& ex,
                                           const std::string&,
                                           bool,
                                           std::error_code& ec) {
    ec = std::make_error_code(std::errc::function_not_supported);
    return stream_type{ex};
}

void unsupported_named_pipe_traits::shutdown(stream_type&, std::error_code& ec) noexcept {
    ec = std::make_error_code(std::errc::function_not_supported);
}

#endif
