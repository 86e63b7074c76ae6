#include "./pipe.hpp"

using namespace apipe;

boost::asio::awaitable<pipe_pair> apipe::create_pipe_pair(pipe_options opts) {
    co_return co_await basic_create_pipe_pair<native_named_pipe_traits>(NEO_MOVE(opts));
}

deferred_read_pipe_pair
apipe::create_pipe_pair_deferred_read(const boost::asio::any_io_executor& ex,
                                      const pipe_options&                 opts) {
    return basic_create_pipe_pair_deferred_read<native_named_pipe_traits>(ex, opts);
}

deferred_write_pipe_pair
apipe::create_pipe_pair_deferred_write(const boost::asio::any_io_executor& ex,
                                       const pipe_options&                 opts) {
    return basic_create_pipe_pair_deferred_write<native_named_pipe_traits>(ex, opts);
}
