#pragma once

#include <string>

namespace platform {

// Empty when neither the XDG variable nor $HOME is set.
std::string config_dir();
std::string data_dir();

std::string ipc_endpoint();

} // namespace platform
