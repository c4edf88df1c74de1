// POSIX subprocess management used by the command executor.

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace easymcp::process
{

struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Check if data (or EOF) is available without blocking longer than timeout_ms
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;

    /// Write all of data; throws ProcessError on a broken pipe
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// A child process with all three standard streams piped back to the parent.
/// The child leads its own process group so kill() reaches any
/// grandchildren it started. The destructor kills and reaps a child that is
/// still running.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Spawn executable (looked up through PATH when it has no '/') with args.
    /// Throws ProcessError when the pipes cannot be created or exec fails.
    void spawn(const std::string& executable, const std::vector<std::string>& args);

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    /// Block until stdout or stderr is readable or timeout_ms elapses.
    /// @return false on timeout or when both pipes are closed
    bool wait_for_output(int timeout_ms);

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Blocking wait for process termination. Exit code, or 128 + signal.
    int wait();

    /// Forcefully kill the process group (SIGKILL)
    void kill();

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

} // namespace easymcp::process
