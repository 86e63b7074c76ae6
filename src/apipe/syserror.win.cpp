#include "./syserror.hpp"

#if _WIN32

#include <windows.h>

using namespace apipe;

std::error_code apipe::get_current_error_code() noexcept {
    return std::error_code(static_cast<int>(::GetLastError()), std::system_category());
}

#endif
