#pragma once

#include "./handle.hpp"
#include "./log.hpp"
#include "./named_pipe.hpp"
#include "./pipe_name.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/fwd.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>

#include <cstdint>
#include <string>
#include <system_error>

namespace apipe {

/**
 * @brief Options that control how a new pipe pair is established
 */
struct pipe_options {
    /**
     * @brief The number of server creation attempts before giving up.
     *
     * Every attempt that fails because its name is already taken uses up one attempt. Once the
     * budget runs out, the error of the last attempt is thrown. Must be at least one.
     */
    int max_attempts = 10;

    /**
     * @brief Whether to ask the OS to refuse clients from other hosts.
     *
     * Some configurations do not accept this restriction. In that case it is dropped once,
     * without using up an attempt, and creation is retried.
     */
    bool reject_remote_clients = true;

    /// Size hint for the OS-side buffers of the listening end
    std::uint32_t buffer_size = 65536;

    /// Receives diagnostics about retries and failures. If null, nothing is logged.
    flow::log::Logger* logger = nullptr;
};

/**
 * @brief An aggregate of a pair of connected read and write ends of a new pipe
 */
template <typename Traits>
struct basic_pipe_pair {
    /// The read-end of the pipe
    basic_pipe_reader<Traits> reader;
    /// The write-end of the pipe
    basic_pipe_writer<Traits> writer;
};

/**
 * @brief A new pipe whose read end still has to perform its connect handshake
 */
template <typename Traits>
struct basic_deferred_read_pair {
    /// The read-end of the pipe, holding the listening end
    pending_connect<basic_pipe_reader<Traits>> reader;
    /// The write-end of the pipe
    basic_pipe_writer<Traits> writer;
};

/**
 * @brief A new pipe whose write end still has to perform its connect handshake
 */
template <typename Traits>
struct basic_deferred_write_pair {
    /// The read-end of the pipe
    basic_pipe_reader<Traits> reader;
    /// The write-end of the pipe, holding the listening end
    pending_connect<basic_pipe_writer<Traits>> writer;
};

namespace detail {

/// Both ends of a named pipe, after the client has opened it but before the handshake
template <typename Traits>
struct unconnected_pipe {
    basic_pipe_server<Traits> server;
    basic_pipe_client<Traits> client;
};

/**
 * Create the listening end under a freshly generated name, retrying on name collisions.
 * `name` receives the name the server was created under.
 */
template <typename Traits>
basic_pipe_server<Traits> create_unique_server(const typename Traits::executor_type& ex,
                                               bool                                  server_writes,
                                               const pipe_options&                   opts,
                                               std::string&                          name) {
    FLOW_LOG_SET_CONTEXT(opts.logger, Log_component::S_PIPE);
    neo_assert(expects,
               opts.max_attempts > 0,
               "pipe_options::max_attempts must be at least one",
               opts.max_attempts);

    bool reject_remote_clients = opts.reject_remote_clients;
    int  tries                 = 0;
    while (true) {
        ++tries;
        // Never reuse a name across attempts
        name = generate_pipe_name();

        std::error_code ec;
        auto            stream = Traits::create_server(ex,
                                            name,
                                            pipe_server_params{
                                                .reject_remote_clients = reject_remote_clients,
                                                .server_writes         = server_writes,
                                                .buffer_size           = opts.buffer_size,
                                            },
                                            ec);
        if (!ec) {
            FLOW_LOG_TRACE("Created pipe [" << name << "] on attempt [" << tries << "].");
            return basic_pipe_server<Traits>{NEO_MOVE(stream)};
        }

        if (tries < opts.max_attempts) {
            if (Traits::is_name_collision(ec)) {
                FLOW_LOG_INFO("Pipe name [" << name << "] is already in use (attempt [" << tries
                                            << "] of [" << opts.max_attempts
                                            << "]). Retrying with a new name.");
                continue;
            }
            if (reject_remote_clients && Traits::is_remote_rejection_unsupported(ec)) {
                FLOW_LOG_INFO("Creating pipe [" << name << "] with remote clients rejected failed ["
                                                << ec << "] [" << ec.message()
                                                << "]. Retrying without the restriction.");
                reject_remote_clients = false;
                // This attempt does not count against the budget
                --tries;
                continue;
            }
        }

        FLOW_LOG_WARNING("Could not create pipe [" << name << "] on attempt [" << tries << "]: ["
                                                   << ec << "] [" << ec.message() << "].");
        throw_for_error_code(ec, "Failed to create the listening end of an anonymous pipe");
    }
}

/// Create both ends of a new named pipe. `server_writes` decides which end reads.
template <typename Traits>
unconnected_pipe<Traits> open_pipe(const typename Traits::executor_type& ex,
                                   bool                                  server_writes,
                                   const pipe_options&                   opts) {
    FLOW_LOG_SET_CONTEXT(opts.logger, Log_component::S_PIPE);

    std::string name;
    auto        server = create_unique_server<Traits>(ex, server_writes, opts, name);

    std::error_code ec;
    auto            client = Traits::open_client(ex, name, !server_writes, ec);
    if (ec) {
        FLOW_LOG_WARNING("Could not open the client end of pipe [" << name << "]: [" << ec << "] ["
                                                                   << ec.message() << "].");
        throw_for_error_code(ec, "Failed to open the connecting end of an anonymous pipe");
    }
    return unconnected_pipe<Traits>{
        .server = NEO_MOVE(server),
        .client = basic_pipe_client<Traits>{NEO_MOVE(client)},
    };
}

}  // namespace detail

/**
 * @brief Create a new anonymous pipe and wait for its two ends to connect.
 *
 * The read end holds the listening end of the named pipe. The write end holds the connecting end.
 *
 * @throws std::system_error carrying the OS error if the pipe cannot be created or connected
 */
template <typename Traits>
boost::asio::awaitable<basic_pipe_pair<Traits>> basic_create_pipe_pair(pipe_options opts = {}) {
    auto ex   = co_await boost::asio::this_coro::executor;
    auto pipe = detail::open_pipe<Traits>(ex, false, opts);

    basic_pipe_reader<Traits> reader{NEO_MOVE(pipe.server)};
    co_await reader.connect();
    co_return basic_pipe_pair<Traits>{
        .reader = NEO_MOVE(reader),
        .writer = basic_pipe_writer<Traits>{NEO_MOVE(pipe.client)},
    };
}

/**
 * @brief Create a new anonymous pipe whose read end connects later.
 *
 * The caller must `co_await std::move(pair.reader).connect()` before reading.
 *
 * @throws std::system_error carrying the OS error if the pipe cannot be created
 */
template <typename Traits>
basic_deferred_read_pair<Traits>
basic_create_pipe_pair_deferred_read(const typename Traits::executor_type& ex,
                                     const pipe_options&                   opts = {}) {
    auto pipe = detail::open_pipe<Traits>(ex, false, opts);
    return basic_deferred_read_pair<Traits>{
        .reader = pending_connect{basic_pipe_reader<Traits>{NEO_MOVE(pipe.server)}},
        .writer = basic_pipe_writer<Traits>{NEO_MOVE(pipe.client)},
    };
}

/**
 * @brief Create a new anonymous pipe whose write end connects later.
 *
 * The caller must `co_await std::move(pair.writer).connect()` before writing.
 *
 * @throws std::system_error carrying the OS error if the pipe cannot be created
 */
template <typename Traits>
basic_deferred_write_pair<Traits>
basic_create_pipe_pair_deferred_write(const typename Traits::executor_type& ex,
                                      const pipe_options&                   opts = {}) {
    auto pipe = detail::open_pipe<Traits>(ex, true, opts);
    return basic_deferred_write_pair<Traits>{
        .reader = basic_pipe_reader<Traits>{NEO_MOVE(pipe.client)},
        .writer = pending_connect{basic_pipe_writer<Traits>{NEO_MOVE(pipe.server)}},
    };
}

}  // namespace apipe
