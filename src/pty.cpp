//
// Pseudo-terminal with a shell process attached to its slave side.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include "pty.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <system_error>
#include <thread>
#include <vector>

extern char **environ;

const char *const DEFAULT_SHELL = "/bin/sh";

// How long the shell gets to exit after hangup before it is killed.
static const int HANGUP_GRACE_MSEC = 500;

static std::system_error os_error(const std::string &what)
{
    return std::system_error(errno, std::generic_category(), what);
}

PtyReader::~PtyReader()
{
    if (fd != -1)
        close(fd);
}

PtyReader::PtyReader(PtyReader &&other) noexcept : fd(other.fd)
{
    other.fd = -1;
}

PtyReader &PtyReader::operator=(PtyReader &&other) noexcept
{
    if (this != &other) {
        if (fd != -1)
            close(fd);
        fd       = other.fd;
        other.fd = -1;
    }
    return *this;
}

ssize_t PtyReader::read(char *buffer, size_t length)
{
    return ::read(fd, buffer, length);
}

//
// Environment of the shell: ours, with TERM replaced.
//
static std::vector<std::string> shell_environment()
{
    std::vector<std::string> env;
    for (char **entry = environ; *entry; ++entry) {
        if (std::strncmp(*entry, "TERM=", 5) != 0)
            env.emplace_back(*entry);
    }
    env.emplace_back("TERM=xterm-256color");
    return env;
}

//
// Runs in the forked child: make the slave our controlling terminal
// and replace the process with the shell. Never returns.
//
[[noreturn]] static void exec_shell(const char *slave_name, char *const argv[], char *const envp[],
                                    int status_fd)
{
    int slave_fd = -1;
    struct termios slave_termios;
    if (setsid() != -1 && (slave_fd = open(slave_name, O_RDWR)) != -1 &&
        ioctl(slave_fd, TIOCSCTTY, 0) != -1 && tcgetattr(slave_fd, &slave_termios) != -1) {
        slave_termios.c_lflag |= ISIG | ICANON | ECHO | ECHOE;
        slave_termios.c_iflag |= ICRNL | IUTF8;
        slave_termios.c_oflag |= OPOST | ONLCR;
        slave_termios.c_cc[VERASE] = 0177; // DEL
        if (tcsetattr(slave_fd, TCSANOW, &slave_termios) != -1) {
            dup2(slave_fd, STDIN_FILENO);
            dup2(slave_fd, STDOUT_FILENO);
            dup2(slave_fd, STDERR_FILENO);
            if (slave_fd > 2)
                close(slave_fd);

            execvpe(argv[0], argv, envp);
        }
    }

    int error = errno;
    ssize_t n = ::write(status_fd, &error, sizeof(error));
    _exit(n == sizeof(error) ? 127 : 126);
}

Pty::Pty(const std::string &shell, int rows, int cols)
{
    master_fd = posix_openpt(O_RDWR | O_NOCTTY);
    if (master_fd == -1) {
        throw os_error("posix_openpt");
    }
    if (fcntl(master_fd, F_SETFD, FD_CLOEXEC) == -1 || grantpt(master_fd) == -1 ||
        unlockpt(master_fd) == -1) {
        auto error = os_error("PTY setup");
        close(master_fd);
        throw error;
    }

    const char *name = ptsname(master_fd);
    if (!name) {
        auto error = os_error("ptsname");
        close(master_fd);
        throw error;
    }
    std::string slave_name = name;

    try {
        spawn_child(slave_name.c_str(), shell, rows, cols);
    } catch (...) {
        close(master_fd);
        throw;
    }
}

void Pty::spawn_child(const char *slave_name, const std::string &shell, int rows, int cols)
{
    struct winsize ws = {};
    ws.ws_row         = rows;
    ws.ws_col         = cols;
    if (ioctl(master_fd, TIOCSWINSZ, &ws) == -1) {
        throw os_error("ioctl TIOCSWINSZ");
    }

    // Nothing may allocate after fork, so prepare arguments here.
    std::vector<std::string> env = shell_environment();
    std::vector<char *> envp;
    for (auto &entry : env) {
        envp.push_back(&entry[0]);
    }
    envp.push_back(nullptr);
    std::string program = shell;
    char *argv[]        = { &program[0], nullptr };

    // The child reports a failed exec through this pipe.
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) == -1) {
        throw os_error("pipe2");
    }

    child_pid = fork();
    if (child_pid == -1) {
        auto error = os_error("fork");
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw error;
    }

    if (child_pid == 0) {
        close(master_fd);
        close(status_pipe[0]);
        exec_shell(slave_name, argv, envp.data(), status_pipe[1]);
    }

    close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close(status_pipe[0]);

    if (n == sizeof(child_errno)) {
        waitpid(child_pid, nullptr, 0);
        reaped = true;
        throw std::system_error(child_errno, std::generic_category(), "exec " + shell);
    }
}

Pty::~Pty()
{
    terminate_child();
}

void Pty::terminate_child()
{
    if (master_fd != -1) {
        close(master_fd);
        master_fd = -1;
    }
    if (child_pid <= 0 || reaped)
        return;

    kill(child_pid, SIGHUP);
    for (int elapsed = 0; elapsed < HANGUP_GRACE_MSEC; elapsed += 10) {
        if (child_exited())
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(child_pid, SIGKILL);
    waitpid(child_pid, nullptr, 0);
    reaped = true;
}

size_t Pty::write(const char *data, size_t length)
{
    size_t done = 0;
    while (done < length) {
        ssize_t n = ::write(master_fd, data + done, length - done);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw os_error("PTY write");
        }
        done += n;
    }
    return done;
}

PtyReader Pty::take_reader() const
{
    int fd = fcntl(master_fd, F_DUPFD_CLOEXEC, 0);
    if (fd == -1) {
        throw os_error("PTY reader");
    }
    return PtyReader(fd);
}

bool Pty::child_exited()
{
    if (reaped)
        return true;
    if (waitpid(child_pid, nullptr, WNOHANG) == child_pid) {
        reaped = true;
    }
    return reaped;
}
