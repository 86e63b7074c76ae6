#include "./syserror.hpp"

#if !_WIN32

#include <cerrno>

using namespace apipe;

std::error_code apipe::get_current_error_code() noexcept {
    return std::error_code(errno, std::system_category());
}

#endif
