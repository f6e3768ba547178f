#include "command_runner.hpp"

#include <asio.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  ~UniqueFd() { reset(); }

  int get() const { return fd_; }
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1) {
    if(fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

void make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
  int fds[2];
  if(::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
}

struct PipeReader {
  PipeReader(asio::io_context& io, int fd) : descriptor(io, fd) {}

  asio::posix::stream_descriptor descriptor;
  std::array<char, 4096> buffer{};
  std::string data;
  bool finished = false;
};

void read_until_eof(PipeReader& reader, const std::function<void()>& on_finished) {
  reader.descriptor.async_read_some(asio::buffer(reader.buffer),
    [&reader, on_finished](const std::error_code& ec, std::size_t n){
      if(n > 0) reader.data.append(reader.buffer.data(), n);
      if(ec) {
        reader.finished = true;
        on_finished();
        return;
      }
      read_until_eof(reader, on_finished);
    });
}

int wait_for_child(pid_t pid) {
  int status = 0;
  while(::waitpid(pid, &status, 0) < 0) {
    if(errno != EINTR) return -1;
  }
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char* const* argv, int stdin_fd, int stdout_fd, int stderr_fd) {
  if(::dup2(stdin_fd, STDIN_FILENO) < 0 ||
     ::dup2(stdout_fd, STDOUT_FILENO) < 0 ||
     ::dup2(stderr_fd, STDERR_FILENO) < 0) {
    ::_exit(127);
  }
  ::execvp(argv[0], argv);
  static const char kPrefix[] = "exec failed: ";
  ssize_t ignored = ::write(STDERR_FILENO, kPrefix, sizeof(kPrefix) - 1);
  ignored = ::write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
  ignored = ::write(STDERR_FILENO, "\n", 1);
  (void)ignored;
  ::_exit(127);
}

std::string join_argv(const std::vector<std::string>& argv) {
  std::string out;
  for(const auto& arg : argv) {
    if(!out.empty()) out += ' ';
    out += arg;
  }
  return out;
}

} // namespace

CommandRunner::CommandRunner(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

CommandResult CommandRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) {
  if(argv.empty()) {
    throw std::invalid_argument("CommandRunner::run requires a program name");
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for(const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  UniqueFd null_in(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if(null_in.get() < 0) {
    throw std::system_error(errno, std::generic_category(), "open /dev/null");
  }
  UniqueFd out_read, out_write, err_read, err_write;
  make_pipe(out_read, out_write);
  make_pipe(err_read, err_write);

  log_debug(logger_.get(), "exec: {}", join_argv(argv));

  pid_t pid = ::fork();
  if(pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if(pid == 0) {
    exec_child(c_argv.data(), null_in.get(), out_write.get(), err_write.get());
  }

  out_write.reset();
  err_write.reset();
  null_in.reset();

  CommandResult result;
  asio::io_context io;
  PipeReader out_reader(io, out_read.release());
  PipeReader err_reader(io, err_read.release());
  asio::steady_timer deadline(io);

  auto on_finished = [&](){
    if(out_reader.finished && err_reader.finished) {
      deadline.cancel();
    }
  };
  read_until_eof(out_reader, on_finished);
  read_until_eof(err_reader, on_finished);

  deadline.expires_after(timeout);
  deadline.async_wait([&](const std::error_code& ec){
    if(ec) return;
    result.timed_out = true;
    ::kill(pid, SIGKILL);
    std::error_code ignored;
    out_reader.descriptor.close(ignored);
    err_reader.descriptor.close(ignored);
  });

  io.run();

  result.exit_status = wait_for_child(pid);
  result.out = std::move(out_reader.data);
  result.err = std::move(err_reader.data);
  if(result.timed_out) {
    log_debug(logger_.get(), "exec timed out after {}ms: {}", timeout.count(), argv.front());
  }
  return result;
}
