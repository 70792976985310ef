#include "shell.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace bale {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };

[[noreturn]] void throw_errno(char const *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_{ fd } {}
  unique_fd(unique_fd &&other) noexcept : fd_{ std::exchange(other.fd_, -1) } {}
  unique_fd &operator=(unique_fd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  unique_fd(unique_fd const &) = delete;
  unique_fd &operator=(unique_fd const &) = delete;
  ~unique_fd() { reset(); }

  int get() const { return fd_; }

  void reset() {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{ -1 };
};

struct pipe_ends {
  unique_fd read;
  unique_fd write;
};

// Both ends close on exec; the child only keeps what it dup2s onto 0, 1 and 2.
pipe_ends make_pipe() {
  int fds[2];
  if (::pipe(fds) == -1) { throw_errno("pipe failed"); }
  pipe_ends ends{ .read = unique_fd{ fds[0] }, .write = unique_fd{ fds[1] } };
  for (int const fd : fds) {
    if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) { throw_errno("fcntl failed"); }
  }
  return ends;
}

std::vector<std::string> shell_argv(shell_choice choice, std::string_view script) {
  std::vector<std::string> argv;
  switch (choice) {
    case shell_choice::bash: argv = { "/usr/bin/env", "bash", "-e", "-c" }; break;
    case shell_choice::sh: argv = { "/bin/sh", "-e", "-c" }; break;
  }
  argv.emplace_back(script);
  return argv;
}

std::vector<char *> to_pointers(std::vector<std::string> &strings) {
  std::vector<char *> pointers;
  pointers.reserve(strings.size() + 1);
  for (auto &s : strings) { pointers.push_back(s.data()); }
  pointers.push_back(nullptr);
  return pointers;
}

// Splits one child stream into lines for its own callback and the combined one.
struct line_sink {
  unique_fd fd;
  std::function<void(std::string_view)> const &on_line;
  std::function<void(std::string_view)> const &on_any;
  std::string pending;

  void emit(std::string_view line) const {
    if (on_line) { on_line(line); }
    if (on_any) { on_any(line); }
  }

  void feed(std::string_view bytes) {
    pending.append(bytes);
    std::size_t start{ 0 };
    for (auto nl{ pending.find('\n') }; nl != std::string::npos;
         nl = pending.find('\n', start)) {
      emit(std::string_view{ pending }.substr(start, nl - start));
      start = nl + 1;
    }
    pending.erase(0, start);
  }

  void finish() {
    fd.reset();
    if (!pending.empty()) {
      emit(pending);
      pending.clear();
    }
  }
};

void pump(std::array<line_sink, 2> &sinks) {
  std::array<char, 4096> chunk;
  std::array<pollfd, 2> fds{};

  for (;;) {
    bool any_open{ false };
    for (std::size_t i{ 0 }; i < sinks.size(); ++i) {
      fds[i] = pollfd{ .fd = sinks[i].fd.get(), .events = POLLIN, .revents = 0 };
      any_open = any_open || fds[i].fd != -1;
    }
    if (!any_open) { return; }

    if (::poll(fds.data(), fds.size(), -1) == -1) {
      if (errno == EINTR) { continue; }
      throw_errno("poll failed");
    }

    for (std::size_t i{ 0 }; i < sinks.size(); ++i) {
      if (fds[i].fd == -1 || fds[i].revents == 0) { continue; }
      if (fds[i].revents & POLLNVAL) { throw std::runtime_error("poll failed on child pipe"); }

      ssize_t const n{ ::read(fds[i].fd, chunk.data(), chunk.size()) };
      if (n == -1) {
        if (errno == EINTR) { continue; }
        throw_errno("read failed");
      }
      if (n == 0) {
        sinks[i].finish();
      } else {
        sinks[i].feed(std::string_view{ chunk.data(), static_cast<std::size_t>(n) });
      }
    }
  }
}

// Payloads are short (a registry URL for a credential helper) and fit the pipe
// buffer, so this completes before any output is read. A child that exits without
// reading is not an error.
void feed_stdin(unique_fd fd, std::string_view data) {
  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  struct sigaction previous {};
  ::sigaction(SIGPIPE, &ignore, &previous);

  int failure{ 0 };
  while (!data.empty()) {
    ssize_t const n{ ::write(fd.get(), data.data(), data.size()) };
    if (n == -1) {
      if (errno == EINTR) { continue; }
      failure = errno;
      break;
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }

  ::sigaction(SIGPIPE, &previous, nullptr);
  if (failure != 0 && failure != EPIPE) {
    throw std::system_error(failure, std::generic_category(), "write to child stdin failed");
  }
}

shell_result reap(pid_t child) {
  int status{ 0 };
  while (::waitpid(child, &status, 0) == -1) {
    if (errno != EINTR) { throw_errno("waitpid failed"); }
  }

  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }
  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }
  return { .exit_code = status, .signal = std::nullopt };
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(int stdin_fd,
                             int stdout_fd,
                             int stderr_fd,
                             char const *cwd,
                             std::vector<char *> const &argv,
                             std::vector<char *> const &envp) {
  int const in{ stdin_fd != -1 ? stdin_fd : ::open("/dev/null", O_RDONLY | O_CLOEXEC) };
  if (in == -1 || ::dup2(in, STDIN_FILENO) == -1 || ::dup2(stdout_fd, STDOUT_FILENO) == -1 ||
      ::dup2(stderr_fd, STDERR_FILENO) == -1) {
    _exit(kChildErrorExit);
  }

  if (cwd && ::chdir(cwd) == -1) {
    std::perror("chdir");
    _exit(kChildErrorExit);
  }

  ::execve(argv[0], argv.data(), envp.data());
  std::perror("execve");
  _exit(kChildErrorExit);
}

}  // namespace

shell_env_t shell_getenv() {
  shell_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view const kv{ *entry };
    auto const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    env[std::string{ kv.substr(0, sep) }] = std::string{ kv.substr(sep + 1) };
  }

  return env;
}

shell_choice shell_parse_choice(std::optional<std::string_view> value) {
  if (!value || value->empty() || *value == "bash") { return shell_choice::bash; }
  if (*value == "sh") { return shell_choice::sh; }
  throw std::invalid_argument("shell option must be 'bash' or 'sh'");
}

std::string shell_quote(std::string_view value) {
  std::string quoted{ "'" };
  for (char const c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

shell_result shell_run(std::string_view script, shell_run_cfg const &cfg) {
  auto argv_strings{ shell_argv(cfg.shell, script) };
  auto const argv{ to_pointers(argv_strings) };

  std::vector<std::string> env_strings;
  env_strings.reserve(cfg.env.size());
  for (auto const &[key, value] : cfg.env) { env_strings.push_back(key + "=" + value); }
  auto const envp{ to_pointers(env_strings) };

  std::string const cwd{ cfg.cwd ? cfg.cwd->string() : std::string{} };

  pipe_ends in;
  if (cfg.stdin_data) { in = make_pipe(); }
  pipe_ends out{ make_pipe() };
  pipe_ends err{ make_pipe() };

  pid_t const child{ ::fork() };
  if (child == -1) { throw_errno("fork failed"); }
  if (child == 0) {
    exec_child(in.read.get(),
               out.write.get(),
               err.write.get(),
               cfg.cwd ? cwd.c_str() : nullptr,
               argv,
               envp);
  }

  in.read.reset();
  out.write.reset();
  err.write.reset();

  try {
    if (cfg.stdin_data) { feed_stdin(std::move(in.write), *cfg.stdin_data); }

    std::array<line_sink, 2> sinks{
      line_sink{ .fd = std::move(out.read),
                 .on_line = cfg.on_stdout_line,
                 .on_any = cfg.on_output_line,
                 .pending = {} },
      line_sink{ .fd = std::move(err.read),
                 .on_line = cfg.on_stderr_line,
                 .on_any = cfg.on_output_line,
                 .pending = {} },
    };
    pump(sinks);
  } catch (std::exception const &) {
    ::kill(child, SIGKILL);
    static_cast<void>(reap(child));
    throw;
  }

  return reap(child);
}

}  // namespace bale
