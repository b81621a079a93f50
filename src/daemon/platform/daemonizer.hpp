#pragma once

namespace platform {

// Detaches from the terminal. Returns only in the final child.
void daemonize();

} // namespace platform
