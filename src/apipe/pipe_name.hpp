#pragma once

#include <string>
#include <string_view>

namespace apipe {

/**
 * @brief The namespace prefix shared by every generated pipe name.
 *
 * Peers that look for pipes created by this library match on this exact prefix, so it must not
 * change.
 */
inline constexpr std::string_view pipe_name_prefix = R"(\\.\pipe\__tokio_anonymous_pipe0__)";

/**
 * @brief Generate a candidate name for a new named pipe instance.
 *
 * The name has the form `<prefix>.<process-id>.<random>`, where `<random>` is a freshly drawn
 * 64-bit unsigned value. Names are only *probably* unique: callers must generate a new name for
 * every creation attempt, and must handle a collision by retrying.
 */
[[nodiscard]] std::string generate_pipe_name();

/// Obtain the OS process ID of the calling process
[[nodiscard]] unsigned long current_process_id() noexcept;

}  // namespace apipe
