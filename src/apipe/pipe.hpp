#pragma once

#include "./establish.hpp"
#include "./handle.hpp"
#include "./named_pipe.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace apipe {

/// A pipe endpoint that is open for reading
using pipe_reader = basic_pipe_reader<native_named_pipe_traits>;
/// A pipe endpoint that is open for writing
using pipe_writer = basic_pipe_writer<native_named_pipe_traits>;
/// The connected read and write ends of a new pipe
using pipe_pair = basic_pipe_pair<native_named_pipe_traits>;
/// A new pipe whose read end has yet to connect
using deferred_read_pipe_pair = basic_deferred_read_pair<native_named_pipe_traits>;
/// A new pipe whose write end has yet to connect
using deferred_write_pipe_pair = basic_deferred_write_pair<native_named_pipe_traits>;

/**
 * @brief Create a new anonymous pipe within the current process, backed by a uniquely named pipe
 * that supports overlapped I/O. Completes once both ends are connected.
 *
 * @throws std::system_error if the pipe cannot be created or connected
 */
boost::asio::awaitable<pipe_pair> create_pipe_pair(pipe_options opts = {});

/**
 * @brief Create a new anonymous pipe. The read end must `connect()` before it can be used.
 *
 * @param ex The executor that will run I/O on the new pipe
 * @throws std::system_error if the pipe cannot be created
 */
deferred_read_pipe_pair create_pipe_pair_deferred_read(const boost::asio::any_io_executor& ex,
                                                       const pipe_options& opts = {});

/**
 * @brief Create a new anonymous pipe. The write end must `connect()` before it can be used.
 *
 * @param ex The executor that will run I/O on the new pipe
 * @throws std::system_error if the pipe cannot be created
 */
deferred_write_pipe_pair create_pipe_pair_deferred_write(const boost::asio::any_io_executor& ex,
                                                         const pipe_options& opts = {});

}  // namespace apipe
