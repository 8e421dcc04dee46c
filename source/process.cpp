#include <prsync/process.hpp>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace prsync {

static int safe_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC); }

CmdResult run_command(const std::vector<std::string> &args,
                      const std::filesystem::path &cwd,
                      const std::unordered_map<std::string, std::string> &env) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exit_code = -1;
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    res.exit_code = -1;
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    return res;
  }

  // argv is prepared before fork; the child only touches its own copy
  std::vector<char *> argv_c;
  argv_c.reserve(args.size() + 1);
  for (auto &s : args)
    argv_c.push_back(const_cast<char *>(s.c_str()));
  argv_c.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = std::string("fork failed: ") + std::strerror(errno);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      _exit(126);
    for (auto &[k, v] : env) {
      if (v.empty())
        ::unsetenv(k.c_str());
      else
        ::setenv(k.c_str(), v.c_str(), 1);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  // both pipes are drained together so a chatty stderr cannot block the child
  std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
  std::array<std::string *, 2> sinks{&res.out, &res.err};
  std::array<char, 4096> buf{};
  int open_fds = 2;
  while (open_fds > 0) {
    int rc = ::poll(fds.data(), fds.size(), -1);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
  for (auto &p : fds)
    if (p.fd >= 0)
      ::close(p.fd);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
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
    bool quote = args[i].empty() ||
                 args[i].find_first_of(" \t\"'") != std::string::npos;
    if (quote)
      oss << '\'' << args[i] << '\'';
    else
      oss << args[i];
  }
  return oss.str();
}

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' ||
                        s.back() == ' ' || s.back() == '\t'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n'))
    ++i;
  return s.substr(i);
}

} // namespace prsync
