#include "./syserror.hpp"

#include <string>

using namespace apipe;

void apipe::throw_for_error_code(std::error_code ec, std::string_view message) {
    throw std::system_error(ec, std::string(message));
}
