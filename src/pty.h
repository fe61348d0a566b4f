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
#ifndef PTY_H
#define PTY_H

#include <sys/types.h>

#include <cstddef>
#include <string>

extern const char *const DEFAULT_SHELL;

//
// Independent read handle on the master side of a pty.
// Owns a duplicated descriptor, so it can live in another thread.
//
class PtyReader {
public:
    explicit PtyReader(int fd) : fd(fd) {}
    ~PtyReader();
    PtyReader(PtyReader &&other) noexcept;
    PtyReader &operator=(PtyReader &&other) noexcept;
    PtyReader(const PtyReader &)            = delete;
    PtyReader &operator=(const PtyReader &) = delete;

    // Pollable descriptor.
    int get_fd() const { return fd; }

    // Blocking read. Returns byte count, 0 on end of file, -1 with errno set on error.
    ssize_t read(char *buffer, size_t length);

private:
    int fd{ -1 };
};

class Pty {
public:
    // Allocate a pty sized rows x cols and spawn the shell on it.
    // Throws std::system_error when the pty or the shell cannot be set up.
    Pty(const std::string &shell, int rows, int cols);
    ~Pty();
    Pty(const Pty &)            = delete;
    Pty &operator=(const Pty &) = delete;

    // Write all bytes to the shell. Throws std::system_error on failure.
    size_t write(const char *data, size_t length);
    size_t write(const std::string &data) { return write(data.data(), data.size()); }

    // Duplicate the master descriptor for a reader thread.
    PtyReader take_reader() const;

    // Master descriptor, for readiness polling.
    int get_fd() const { return master_fd; }
    pid_t get_pid() const { return child_pid; }

    // Reap the child if it has terminated.
    bool child_exited();

private:
    int master_fd{ -1 };
    pid_t child_pid{ -1 };
    bool reaped{};

    void spawn_child(const char *slave_name, const std::string &shell, int rows, int cols);
    void terminate_child();
};

#endif // PTY_H
