#pragma once

namespace platform {

// Detach from the terminal: double fork, new session, cwd "/", stdio to /dev/null.
// Only the grandchild returns; false means a step after the first fork failed.
bool daemonize();

} // namespace platform
