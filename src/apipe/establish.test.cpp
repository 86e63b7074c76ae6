#include "./establish.hpp"

#if !_WIN32

#include <apipe/test/socket_pipe_traits.hpp>
#include <apipe/test/test_logger.hpp>
#include <apipe/test/test_util.hpp>

#include <catch2/catch.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <set>
#include <string>
#include <system_error>

namespace asio = boost::asio;

using apipe::test::socket_pipe_traits;

namespace {

using world = socket_pipe_traits::world;

std::error_code collision() { return std::make_error_code(std::errc::file_exists); }
std::error_code restriction_unsupported() {
    return std::make_error_code(std::errc::invalid_argument);
}

void queue_server_errors(world& w, std::error_code ec, int n) {
    for (int i = 0; i < n; ++i) {
        w.server_errors.push_back(ec);
    }
}

/// Create a deferred-read pipe and return the error it failed with, or a default error_code
std::error_code deferred_read_error(asio::io_context& ioc, const apipe::pipe_options& opts = {}) {
    try {
        auto pipe
            = apipe::basic_create_pipe_pair_deferred_read<socket_pipe_traits>(ioc.get_executor(),
                                                                              opts);
        return {};
    } catch (const std::system_error& e) {
        return e.code();
    }
}

asio::awaitable<int> immediate_pipe_roles() {
    auto [reader, writer] = co_await apipe::basic_create_pipe_pair<socket_pipe_traits>();
    co_return reader.role() == apipe::pipe_role::server
        && writer.role() == apipe::pipe_role::client;
}

}  // namespace

TEST_CASE("The first attempt succeeds") {
    asio::io_context ioc;
    world            w;

    auto pipe = apipe::basic_create_pipe_pair_deferred_read<socket_pipe_traits>(ioc.get_executor());
    REQUIRE(w.server_attempts.size() == 1);
    auto& attempt = w.server_attempts.front();
    CHECK(attempt.name.starts_with(apipe::pipe_name_prefix));
    CHECK(attempt.params.reject_remote_clients);
    CHECK_FALSE(attempt.params.server_writes);
    CHECK(attempt.params.buffer_size == 65536);
    // The listening end reads, so the connecting end writes
    REQUIRE(w.client_writes.size() == 1);
    CHECK(w.client_writes.front());
    CHECK(w.handshakes == 0);
    CHECK(w.listening.empty());
}

TEST_CASE("The deferred write form listens on the write end") {
    asio::io_context ioc;
    world            w;

    auto pipe
        = apipe::basic_create_pipe_pair_deferred_write<socket_pipe_traits>(ioc.get_executor());
    REQUIRE(w.server_attempts.size() == 1);
    CHECK(w.server_attempts.front().params.server_writes);
    REQUIRE(w.client_writes.size() == 1);
    CHECK_FALSE(w.client_writes.front());
    CHECK(pipe.reader.role() == apipe::pipe_role::client);
    CHECK(w.handshakes == 0);
}

TEST_CASE("The immediate form performs the handshake") {
    asio::io_context ioc;
    world            w;

    CHECK(apipe::test::run_awaitable(ioc, immediate_pipe_roles()) == 1);
    CHECK(w.handshakes == 1);
    REQUIRE(w.client_writes.size() == 1);
    CHECK(w.client_writes.front());
}

TEST_CASE("Name collisions are retried under new names") {
    asio::io_context ioc;
    world            w;
    queue_server_errors(w, collision(), 3);

    CHECK_FALSE(deferred_read_error(ioc));
    REQUIRE(w.server_attempts.size() == 4);

    std::set<std::string> names;
    for (auto& attempt : w.server_attempts) {
        names.insert(attempt.name);
        CHECK(attempt.params.reject_remote_clients);
    }
    CHECK(names.size() == 4);
    // Only the successful attempt is opened
    CHECK(w.client_writes.size() == 1);
}

TEST_CASE("Give up after ten name collisions") {
    asio::io_context ioc;
    world            w;
    queue_server_errors(w, collision(), 20);

    auto ec = deferred_read_error(ioc);
    CHECK(ec == std::errc::file_exists);
    CHECK(w.server_attempts.size() == 10);
    CHECK(w.server_errors.size() == 10);
    CHECK(w.client_writes.empty());
}

TEST_CASE("Nine collisions still succeed") {
    asio::io_context ioc;
    world            w;
    queue_server_errors(w, collision(), 9);

    CHECK_FALSE(deferred_read_error(ioc));
    CHECK(w.server_attempts.size() == 10);
}

TEST_CASE("Dropping the remote-client restriction does not use up an attempt") {
    asio::io_context ioc;
    world            w;
    w.server_errors.push_back(restriction_unsupported());
    queue_server_errors(w, collision(), 9);

    CHECK_FALSE(deferred_read_error(ioc));
    REQUIRE(w.server_attempts.size() == 11);
    CHECK(w.server_attempts.front().params.reject_remote_clients);
    for (std::size_t i = 1; i < w.server_attempts.size(); ++i) {
        CHECK_FALSE(w.server_attempts[i].params.reject_remote_clients);
    }
}

TEST_CASE("The restriction fallback does not extend the collision budget") {
    asio::io_context ioc;
    world            w;
    w.server_errors.push_back(restriction_unsupported());
    queue_server_errors(w, collision(), 10);

    auto ec = deferred_read_error(ioc);
    CHECK(ec == std::errc::file_exists);
    CHECK(w.server_attempts.size() == 11);
}

TEST_CASE("The restriction is only dropped once") {
    asio::io_context ioc;
    world            w;
    queue_server_errors(w, restriction_unsupported(), 2);

    auto ec = deferred_read_error(ioc);
    CHECK(ec == std::errc::invalid_argument);
    CHECK(w.server_attempts.size() == 2);
}

TEST_CASE("Any error on the last attempt is returned") {
    asio::io_context ioc;
    world            w;
    queue_server_errors(w, collision(), 9);
    w.server_errors.push_back(restriction_unsupported());

    auto ec = deferred_read_error(ioc);
    CHECK(ec == std::errc::invalid_argument);
    CHECK(w.server_attempts.size() == 10);
}

TEST_CASE("Unexpected server errors are fatal") {
    asio::io_context ioc;
    world            w;
    w.server_errors.push_back(std::make_error_code(std::errc::permission_denied));

    auto ec = deferred_read_error(ioc);
    CHECK(ec == std::errc::permission_denied);
    CHECK(w.server_attempts.size() == 1);
    CHECK(w.client_writes.empty());
}

TEST_CASE("A failure to open the connecting end is fatal") {
    asio::io_context ioc;
    world            w;
    w.client_errors.push_back(std::make_error_code(std::errc::too_many_files_open));

    auto ec = deferred_read_error(ioc);
    CHECK(ec == std::errc::too_many_files_open);
    CHECK(w.server_attempts.size() == 1);
    CHECK(w.client_writes.size() == 1);
}

TEST_CASE("Failures of the immediate form surface from the coroutine") {
    asio::io_context ioc;
    world            w;
    w.server_errors.push_back(std::make_error_code(std::errc::permission_denied));

    try {
        apipe::test::run_awaitable(ioc, immediate_pipe_roles());
        FAIL_CHECK("Expected an error");
    } catch (const std::system_error& e) {
        CHECK(e.code() == std::errc::permission_denied);
    }
    CHECK(w.handshakes == 0);
}

TEST_CASE("Creation options are honored") {
    asio::io_context ioc;
    world            w;

    SECTION("A smaller attempt budget") {
        queue_server_errors(w, collision(), 5);
        auto ec = deferred_read_error(ioc, {.max_attempts = 3});
        CHECK(ec == std::errc::file_exists);
        CHECK(w.server_attempts.size() == 3);
    }

    SECTION("Remote clients allowed from the start") {
        CHECK_FALSE(deferred_read_error(ioc, {.reject_remote_clients = false}));
        REQUIRE(w.server_attempts.size() == 1);
        CHECK_FALSE(w.server_attempts.front().params.reject_remote_clients);
    }

    SECTION("No fallback without the restriction") {
        w.server_errors.push_back(restriction_unsupported());
        auto ec = deferred_read_error(ioc, {.reject_remote_clients = false});
        CHECK(ec == std::errc::invalid_argument);
        CHECK(w.server_attempts.size() == 1);
    }

    SECTION("Buffer size") {
        CHECK_FALSE(deferred_read_error(ioc, {.buffer_size = 4096}));
        REQUIRE(w.server_attempts.size() == 1);
        CHECK(w.server_attempts.front().params.buffer_size == 4096);
    }
}

TEST_CASE("A failed handshake fails the immediate form") {
    asio::io_context ioc;
    world            w;
    w.handshake_errors.push_back(asio::error::connection_refused);

    try {
        apipe::test::run_awaitable(ioc, immediate_pipe_roles());
        FAIL_CHECK("Expected the handshake to fail");
    } catch (const std::system_error& e) {
        const boost::system::error_code refused = asio::error::connection_refused;
        CHECK(e.code() == std::error_code(refused));
    }
    CHECK(w.handshakes == 1);
}

TEST_CASE("Retries and failures are logged") {
    asio::io_context         ioc;
    world                    w;
    apipe::test::test_logger logger;
    w.server_errors.push_back(collision());
    w.server_errors.push_back(std::make_error_code(std::errc::permission_denied));

    {
        FLOW_LOG_SET_CONTEXT(&logger, apipe::Log_component::S_TEST);
        FLOW_LOG_INFO("Creating a pipe against one scripted collision.");
    }
    auto ec = deferred_read_error(ioc, {.logger = &logger});
    CHECK(ec == std::errc::permission_denied);

    auto text      = logger.text();
    auto test_line = text.find("one scripted collision");
    REQUIRE(test_line != std::string::npos);
    auto retry_line = text.find("is already in use");
    REQUIRE(retry_line != std::string::npos);
    CHECK(retry_line > test_line);
    CHECK(text.find("Could not create pipe") != std::string::npos);
    CHECK(text.find(w.server_attempts.front().name) != std::string::npos);
}

#endif
