#include "shell.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace packup {

namespace {

constexpr std::size_t kStderrTailLines{ 20 };

class fd_guard : unmovable {
 public:
  explicit fd_guard(int fd) : fd_{ fd } {}
  ~fd_guard() {
    if (fd_ >= 0) { ::close(fd_); }
  }
  int get() const { return fd_; }

 private:
  int fd_;
};

fd_guard open_or_throw(std::filesystem::path const &path, int flags) {
  int const fd{ ::open(path.c_str(), flags | O_CLOEXEC, 0600) };
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "shell_run: open " + path.string());
  }
  return fd_guard{ fd };
}

// Inherited environment with overrides applied. Overridden names are dropped
// from the inherited set so each name appears once.
std::vector<std::string> build_environment(shell_env_t const &overrides) {
  std::vector<std::string> entries;
  for (char **e{ environ }; e && *e; ++e) {
    std::string_view const entry{ *e };
    auto const eq{ entry.find('=') };
    if (eq != std::string_view::npos &&
        overrides.count(std::string{ entry.substr(0, eq) })) {
      continue;
    }
    entries.emplace_back(entry);
  }
  for (auto const &[name, value] : overrides) { entries.push_back(name + "=" + value); }
  return entries;
}

std::vector<char *> c_strings(std::vector<std::string> &strings) {
  std::vector<char *> out;
  out.reserve(strings.size() + 1);
  for (auto &s : strings) { out.push_back(s.data()); }
  out.push_back(nullptr);
  return out;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(char *const *argv,
                             char **envp,
                             char const *cwd,
                             int null_fd,
                             int out_fd,
                             int err_fd) {
  if (::dup2(null_fd, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0 ||
      ::dup2(err_fd, STDERR_FILENO) < 0) {
    ::_exit(127);
  }

  if (cwd && ::chdir(cwd) != 0) {
    char const msg[]{ "packup: chdir failed\n" };
    (void)!::write(STDERR_FILENO, msg, sizeof msg - 1);
    ::_exit(127);
  }

  environ = envp;
  ::execvp(argv[0], argv);

  char const msg[]{ "packup: exec failed: " };
  (void)!::write(STDERR_FILENO, msg, sizeof msg - 1);
  (void)!::write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
  (void)!::write(STDERR_FILENO, "\n", 1);
  ::_exit(127);
}

int wait_for(pid_t pid) {
  int status{ 0 };
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "shell_run: waitpid");
    }
  }
  if (WIFEXITED(status)) { return WEXITSTATUS(status); }
  if (WIFSIGNALED(status)) { return 128 + WTERMSIG(status); }
  return 1;
}

std::string join_argv(std::vector<std::string> const &argv) {
  std::string out;
  for (auto const &arg : argv) {
    if (!out.empty()) { out.push_back(' '); }
    out.append(arg);
  }
  return out;
}

void log_lines(std::string_view text) {
  while (!text.empty()) {
    auto const nl{ text.find('\n') };
    auto const line{ text.substr(0, nl) };
    tui::debug("%.*s", static_cast<int>(line.size()), line.data());
    if (nl == std::string_view::npos) { break; }
    text.remove_prefix(nl + 1);
  }
}

}  // namespace

shell_result shell_run(std::vector<std::string> const &argv, shell_options const &opts) {
  if (argv.empty()) { throw std::invalid_argument("shell_run: argv must be non-empty"); }

  scoped_temp_dir capture{ "run" };
  auto const out_path{ capture.path() / "stdout" };
  auto const err_path{ capture.path() / "stderr" };

  // Everything the child touches is prepared before fork.
  std::vector<std::string> args{ argv };
  auto const c_args{ c_strings(args) };
  auto env_strings{ build_environment(opts.env) };
  auto c_env{ c_strings(env_strings) };
  std::string const cwd{ opts.cwd ? opts.cwd->string() : std::string{} };

  pid_t pid{ -1 };
  {
    auto const null_fd{ open_or_throw("/dev/null", O_RDONLY) };
    auto const out_fd{ open_or_throw(out_path, O_WRONLY | O_CREAT | O_TRUNC) };
    auto const err_fd{ open_or_throw(err_path, O_WRONLY | O_CREAT | O_TRUNC) };

    pid = ::fork();
    if (pid < 0) {
      throw std::system_error(errno, std::generic_category(), "shell_run: fork");
    }
    if (pid == 0) {
      exec_child(c_args.data(),
                 c_env.data(),
                 opts.cwd ? cwd.c_str() : nullptr,
                 null_fd.get(),
                 out_fd.get(),
                 err_fd.get());
    }
  }

  int const exit_code{ wait_for(pid) };
  return { .exit_code = exit_code,
           .out = util_load_text(out_path),
           .err = util_load_text(err_path) };
}

shell_result shell_run_tool(std::vector<std::string> const &argv, shell_options const &opts) {
  if (argv.empty()) { throw std::invalid_argument("shell_run_tool: argv must be non-empty"); }

  tui::debug("run: %s", join_argv(argv).c_str());
  auto result{ shell_run(argv, opts) };
  log_lines(result.out);
  log_lines(result.err);

  if (result.exit_code != 0) {
    throw external_tool_error{ std::filesystem::path{ argv.front() }.filename().string(),
                               result.exit_code,
                               shell_tail(result.err, kStderrTailLines) };
  }
  return result;
}

std::string shell_tail(std::string_view text, std::size_t max_lines) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  if (max_lines == 0) { return {}; }

  auto start{ text.size() };
  std::size_t lines{ 0 };
  while (start > 0) {
    auto const nl{ text.rfind('\n', start - 1) };
    if (++lines == max_lines || nl == std::string_view::npos) {
      start = (lines == max_lines && nl != std::string_view::npos) ? nl + 1 : 0;
      break;
    }
    start = nl;
  }
  return std::string{ text.substr(start) };
}

std::string shell_quote(std::string_view s) {
  std::string out{ "'" };
  for (char const c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

}  // namespace packup
