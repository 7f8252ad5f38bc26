/**
 * @file ffmpeg_executor.cpp
 * @brief External media tool invocation implementation
 */

#include "dashcam_merge/ffmpeg_executor.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace dashcam_merge {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

bool is_executable_file(const fs::path &p) {
  struct stat st;
  if (::stat(p.c_str(), &st) != 0)
    return false;
  return S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/// Keep only the last STDERR_TAIL_BYTES of a growing buffer
void append_tail(std::string &tail, const char *data, size_t n) {
  tail.append(data, n);
  if (tail.size() > STDERR_TAIL_BYTES)
    tail.erase(0, tail.size() - STDERR_TAIL_BYTES);
}

} // anonymous namespace

// **---- ToolResult ----**

std::string ToolResult::describe() const {
  switch (status) {
  case ToolStatus::Exited:
    return fmt::format("exit code {}", exit_code);
  case ToolStatus::Signaled:
    return fmt::format("killed by signal {}", signal);
  case ToolStatus::NotFound:
    return "tool not found";
  case ToolStatus::SpawnFailed:
    return "could not start tool";
  }
  return "unknown";
}

// **---- Lookup ----**

std::optional<fs::path> find_executable(const std::string &name) {
  if (name.empty())
    return std::nullopt;

  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name))
      return fs::path(name);
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  size_t pos = 0;
  while (pos <= search.size()) {
    size_t end = search.find(':', pos);
    if (end == std::string::npos)
      end = search.size();
    std::string dir = search.substr(pos, end - pos);
    if (dir.empty())
      dir = ".";
    fs::path candidate = fs::path(dir) / name;
    if (is_executable_file(candidate))
      return candidate;
    pos = end + 1;
  }
  return std::nullopt;
}

// **---- Command Construction ----**

std::vector<std::string> build_merge_args(const MergeJob &job,
                                          TranscodeProfile profile,
                                          const MergerConfig &config) {
  std::vector<std::string> args = {"-nostdin", "-hide_banner", "-loglevel",
                                   "error",    "-f",           "concat",
                                   "-safe",    "0",            "-i",
                                   job.manifest_path.string()};

  if (profile == TranscodeProfile::Copy) {
    args.insert(args.end(), {"-c:v", config.copy.video_codec, "-c:a",
                             config.copy.audio_codec, "-avoid_negative_ts",
                             "make_zero", "-fflags", "+genpts"});
  } else {
    const ReencodeProfile &re = config.reencode;
    args.insert(args.end(),
                {"-c:v", re.video_codec, "-c:a", re.audio_codec, "-preset",
                 re.preset, "-crf", re.crf});
    if (re.threads > 0) {
      args.push_back("-threads");
      args.push_back(std::to_string(re.threads));
    }
    args.insert(args.end(), {"-avoid_negative_ts", "make_zero"});
  }

  args.push_back("-y");
  args.push_back(job.work_output.string());
  return args;
}

// **---- Execution ----**

ToolResult run_tool(const std::string &tool,
                    const std::vector<std::string> &args) {
  ToolResult result;

  auto resolved = find_executable(tool);
  if (!resolved) {
    result.status = ToolStatus::NotFound;
    return result;
  }
  std::string exe = resolved->string();

  /// argv must be fully built before fork (child only calls async-safe code)
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(tool.c_str()));
  for (const auto &arg : args)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  int err_pipe[2] = {-1, -1};  //< child stderr
  int exec_pipe[2] = {-1, -1}; //< exec errno, closes on successful exec
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    result.stderr_tail = std::strerror(errno);
    return result;
  }
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    result.stderr_tail = std::strerror(errno);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return result;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    result.stderr_tail = std::strerror(errno);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    return result;
  }

  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
    }
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execv(exe.c_str(), argv.data());

    int err = errno;
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  /// Did exec succeed?
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);
  bool exec_failed = (n == static_cast<ssize_t>(sizeof(exec_errno)));

  /// Drain stderr until the child closes it
  char buf[4096];
  for (;;) {
    n = ::read(err_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      append_tail(result.stderr_tail, buf, static_cast<size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  close_fd(err_pipe[0]);

  int wstatus = 0;
  while (::waitpid(pid, &wstatus, 0) < 0) {
    if (errno != EINTR) {
      result.status = ToolStatus::SpawnFailed;
      result.stderr_tail += std::strerror(errno);
      return result;
    }
  }

  if (exec_failed) {
    result.status = (exec_errno == ENOENT || exec_errno == EACCES)
                        ? ToolStatus::NotFound
                        : ToolStatus::SpawnFailed;
    result.stderr_tail = std::strerror(exec_errno);
    return result;
  }

  if (WIFEXITED(wstatus)) {
    result.status = ToolStatus::Exited;
    result.exit_code = WEXITSTATUS(wstatus);
  } else if (WIFSIGNALED(wstatus)) {
    result.status = ToolStatus::Signaled;
    result.signal = WTERMSIG(wstatus);
  }
  return result;
}

} // namespace dashcam_merge
