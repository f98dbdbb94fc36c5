#include <prflow/process.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace prflow {

static int safe_pipe(int fds[2]) { return pipe2(fds, O_CLOEXEC); }

// Drains both pipes together so a chatty child cannot block on a full stderr
// while we wait on stdout.
static void read_both(int out_fd, int err_fd, std::string &out,
                      std::string &err) {
  std::array<char, 4096> buf{};
  struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
  int open_fds = 2;
  while (open_fds > 0) {
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        (i == 0 ? out : err).append(buf.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
}

CmdResult run_command(const std::vector<std::string> &args,
                      const std::filesystem::path &cwd) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }

  pid_t pid = fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = "fork failed";
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      _exit(126);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    std::vector<char *> argv_c;
    argv_c.reserve(args.size() + 1);
    for (auto &s : args)
      argv_c.push_back(const_cast<char *>(s.c_str()));
    argv_c.push_back(nullptr);

    execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  read_both(out_pipe[0], err_pipe[0], res.out, res.err);
  close(out_pipe[0]);
  close(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      res.exit_code = -1;
      return res;
    }
  }
  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_code = 128 + WTERMSIG(status);
  else
    res.exit_code = -1;

  return res;
}

std::string join_args(const std::vector<std::string> &args) {
  std::ostringstream oss;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i)
      oss << ' ';
    const auto &a = args[i];
    bool quote = a.empty() || a.find_first_of(" \t\n\"'") != std::string::npos;
    if (!quote) {
      oss << a;
      continue;
    }
    oss << '\'';
    for (char c : a) {
      if (c == '\'')
        oss << "'\\''";
      else
        oss << c;
    }
    oss << '\'';
  }
  return oss.str();
}

std::string trim_trailing_newlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

} // namespace prflow
