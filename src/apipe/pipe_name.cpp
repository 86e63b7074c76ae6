#include "./pipe_name.hpp"

#include <neo/ufmt.hpp>

#include <cstdint>
#include <random>

#if _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

using namespace apipe;

namespace {

std::uint64_t random_u64() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return std::uniform_int_distribution<std::uint64_t>{}(engine);
}

}  // namespace

unsigned long apipe::current_process_id() noexcept {
#if _WIN32
    return static_cast<unsigned long>(::GetCurrentProcessId());
#else
    return static_cast<unsigned long>(::getpid());
#endif
}

std::string apipe::generate_pipe_name() {
    return neo::ufmt("{}.{}.{}", pipe_name_prefix, current_process_id(), random_u64());
}
