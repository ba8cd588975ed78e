#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <persistor/command.hpp>
#include <poll.h>
#include <string>
#include <sys/wait.h>
#include <tl/expected.hpp>
#include <unistd.h>
#include <vector>

namespace persistor {

namespace {

constexpr const int child_exec_failure{127};

// owns both ends of a pipe and closes whatever remains open
class Pipe {
 private:
  std::array<int, 2> _fds{-1, -1};

 public:
  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() {
    close_read();
    close_write();
  }

  [[nodiscard]] bool open() noexcept { return ::pipe2(_fds.data(), O_CLOEXEC) == 0; }

  [[nodiscard]] int read_end() const noexcept { return _fds[0]; }

  [[nodiscard]] int write_end() const noexcept { return _fds[1]; }

  void close_read() noexcept {
    if (_fds[0] >= 0) {
      ::close(_fds[0]);
      _fds[0] = -1;
    }
  }

  void close_write() noexcept {
    if (_fds[1] >= 0) {
      ::close(_fds[1]);
      _fds[1] = -1;
    }
  }
};

// drains stdout and stderr of the child together so neither pipe fills up
void drain(Pipe& out_pipe, Pipe& err_pipe, Command_output& output) {
  std::array<char, 4096> buffer{};
  std::array<pollfd, 2> fds{pollfd{.fd = out_pipe.read_end(), .events = POLLIN, .revents = 0},
                            pollfd{.fd = err_pipe.read_end(), .events = POLLIN, .revents = 0}};
  std::array<std::string*, 2> sinks{&output.out, &output.err};

  int open_fds = 2;
  while (open_fds > 0) {
    if (::poll(fds.data(), fds.size(), -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      const auto num_read = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (num_read > 0) {
        sinks[i]->append(buffer.data(), static_cast<std::size_t>(num_read));
      } else if (num_read == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
}

}  // namespace

tl::expected<Command_output, std::string> run_command(
    const std::vector<std::string>& argv) {
  if (argv.empty()) {
    return tl::make_unexpected("No command was given to run.");
  }

  Pipe out_pipe;
  Pipe err_pipe;
  if (!out_pipe.open() || !err_pipe.open()) {
    return tl::make_unexpected(
        fmt::format("pipe() failed for {}: {}", argv.front(), std::strerror(errno)));
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    return tl::make_unexpected(
        fmt::format("fork() failed for {}: {}", argv.front(), std::strerror(errno)));
  }

  if (pid == 0) {  // child
    ::dup2(out_pipe.write_end(), STDOUT_FILENO);
    ::dup2(err_pipe.write_end(), STDERR_FILENO);
    ::execvp(c_argv[0], c_argv.data());
    ::_exit(child_exec_failure);
  }

  // parent
  out_pipe.close_write();
  err_pipe.close_write();
  Command_output output;
  drain(out_pipe, err_pipe, output);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return tl::make_unexpected(
          fmt::format("waitpid() failed for {}: {}", argv.front(), std::strerror(errno)));
    }
  }

  if (WIFEXITED(status)) {
    output.exit_status = WEXITSTATUS(status);
  }
  if (output.exit_status == child_exec_failure && output.out.empty() &&
      output.err.empty()) {
    return tl::make_unexpected(
        fmt::format("The command {} could not be executed. Is it installed?",
                    argv.front()));
  }
  return output;
}

std::string command_line(const std::vector<std::string>& argv) {
  return fmt::format("{}", fmt::join(argv, " "));
}

}  // namespace persistor
