#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

// Parent exits, child continues.
bool fork_and_detach_parent() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        return false;
    }
    if (pid > 0) _exit(0);
    return true;
}

void redirect_stdio() {
    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) return;
    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(null_fd, STDERR_FILENO);
    if (null_fd > STDERR_FILENO) ::close(null_fd);
}

} // namespace

bool daemonize() {
    if (!fork_and_detach_parent()) _exit(1);

    if (setsid() < 0) {
        std::println(stderr, "setsid() failed: {}", std::strerror(errno));
        return false;
    }

    // Fork again to prevent reacquiring a controlling terminal
    if (!fork_and_detach_parent()) return false;

    umask(022);
    if (::chdir("/") < 0) {
        std::println(stderr, "chdir(/) failed: {}", std::strerror(errno));
        return false;
    }

    redirect_stdio();
    return true;
}

} // namespace platform
