#pragma once

#include <string_view>
#include <system_error>

namespace apipe {

/**
 * @brief Get the calling thread's last OS error (`GetLastError()` or `errno`) as a
 * std::error_code in the system category
 */
[[nodiscard]] std::error_code get_current_error_code() noexcept;

/**
 * @brief Throw a std::system_error that carries the given error code unmodified, along with a
 * message describing the operation that failed
 *
 * @param ec The error to report
 * @param message A message to include in the exception
 */
[[noreturn]] void throw_for_error_code(std::error_code ec, std::string_view message);

}  // namespace apipe
