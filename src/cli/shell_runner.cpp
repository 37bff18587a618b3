/*
 * Shell runner - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <nl2cmd/cli/shell_runner.hpp>
#include <nl2cmd/util/log.hpp>
#include <cstdlib>
#ifdef _WIN32
#include <cstdio>
#else
#include <unistd.h>
#include <sys/wait.h>
#include <csignal>
#include <cerrno>
#include <cstdio>
#endif

namespace nl2cmd::cli {

#ifdef _WIN32
int run_shell_command(const std::string& command) {
    log::debug_stream() << "cmd /c " << command;
    int rc = std::system(command.c_str());
    return rc < 0 ? 127 : rc;
}
#else
int run_shell_command(const std::string& command) {
    log::debug_stream() << "/bin/sh -c " << command;
    pid_t pid = fork();
    if (pid < 0) { perror("fork"); return 127; }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        perror("execl");
        _exit(127);
    }
    // the child owns the terminal's Ctrl-C while it runs
    auto prev = std::signal(SIGINT, SIG_IGN);
    int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    std::signal(SIGINT, prev);
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 0;
}
#endif

} // namespace nl2cmd::cli
