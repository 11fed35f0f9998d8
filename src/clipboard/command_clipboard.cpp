#include "command_clipboard.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace clipmesh {

namespace {

constexpr int kExecFailed = 127;

void close_quiet(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? (int)left.count() : 0;
}

} // namespace

bool run_process(const std::vector<std::string> &argv,
                 const std::vector<uint8_t> *input,
                 std::vector<uint8_t> *output, int &exit_code,
                 std::chrono::milliseconds timeout) {
  exit_code = -1;
  if (argv.empty())
    return false;

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  if (input && ::pipe(in_pipe) != 0)
    return false;
  if (output && ::pipe(out_pipe) != 0) {
    close_quiet(in_pipe[0]);
    close_quiet(in_pipe[1]);
    return false;
  }

  // Everything the child touches is prepared before fork.
  std::vector<char *> args;
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > 65536)
    max_fd = 65536;

  pid_t pid = ::fork();
  if (pid < 0) {
    close_quiet(in_pipe[0]);
    close_quiet(in_pipe[1]);
    close_quiet(out_pipe[0]);
    close_quiet(out_pipe[1]);
    return false;
  }
  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDWR);
    ::dup2(input ? in_pipe[0] : devnull, 0);
    ::dup2(output ? out_pipe[1] : devnull, 1);
    ::dup2(devnull, 2);
    for (long fd = 3; fd < max_fd; fd++)
      ::close((int)fd);
    ::execvp(args[0], args.data());
    ::_exit(kExecFailed);
  }

  close_quiet(in_pipe[0]);
  close_quiet(out_pipe[1]);
  auto deadline = std::chrono::steady_clock::now() + timeout;
  bool timed_out = false;

  if (input) {
    ::fcntl(in_pipe[1], F_SETFL, ::fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);
    size_t off = 0;
    while (off < input->size()) {
      pollfd pfd{in_pipe[1], POLLOUT, 0};
      int rc = ::poll(&pfd, 1, remaining_ms(deadline));
      if (rc == 0) {
        timed_out = true;
        break;
      }
      if (rc < 0 && errno == EINTR)
        continue;
      if (rc < 0)
        break;
      ssize_t n = ::write(in_pipe[1], input->data() + off, input->size() - off);
      if (n < 0 && (errno == EAGAIN || errno == EINTR))
        continue;
      if (n <= 0)
        break;
      off += (size_t)n;
    }
    close_quiet(in_pipe[1]);
  }

  if (output && !timed_out) {
    output->clear();
    uint8_t buf[64 * 1024];
    while (true) {
      pollfd pfd{out_pipe[0], POLLIN, 0};
      int rc = ::poll(&pfd, 1, remaining_ms(deadline));
      if (rc == 0) {
        timed_out = true;
        break;
      }
      if (rc < 0 && errno == EINTR)
        continue;
      if (rc < 0)
        break;
      ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0)
        break;
      output->insert(output->end(), buf, buf + n);
      if (output->size() > kMaxFrameBody) {
        Logger::instance().log(LogLevel::WARN, "%s: output too large",
                               argv[0].c_str());
        timed_out = true;
        break;
      }
    }
  }
  close_quiet(out_pipe[0]);

  if (timed_out)
    ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if (timed_out)
    return false;
  exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return true;
}

std::vector<std::string> parse_uri_list(const std::string &body) {
  std::vector<std::string> paths;
  size_t pos = 0;
  while (pos <= body.size()) {
    size_t nl = body.find('\n', pos);
    std::string line = trim(body.substr(
        pos, nl == std::string::npos ? std::string::npos : nl - pos));
    pos = nl == std::string::npos ? body.size() + 1 : nl + 1;
    if (line.empty() || line[0] == '#')
      continue;
    static const std::string kScheme = "file://";
    if (line.compare(0, kScheme.size(), kScheme) != 0)
      continue;
    std::string rest = line.substr(kScheme.size());
    // file://host/path: drop the authority
    if (!rest.empty() && rest[0] != '/') {
      auto slash = rest.find('/');
      if (slash == std::string::npos)
        continue;
      rest = rest.substr(slash);
    }
    paths.push_back(percent_decode(rest));
  }
  return paths;
}

std::string make_uri_list(const std::vector<std::string> &paths) {
  std::string out;
  for (const auto &p : paths)
    out += "file://" + percent_encode_path(p) + "\r\n";
  return out;
}

bool CommandClipboard::list_types(std::vector<std::string> &types) {
  types.clear();
  std::vector<uint8_t> out;
  int code = 0;
  if (!run_process(list_types_cmd(), nullptr, &out, code))
    return false;
  if (code == kExecFailed) {
    Logger::instance().log(LogLevel::ERROR, "%s: helper tool not found",
                           name());
    return false;
  }
  // Helpers exit non-zero when nothing owns the selection.
  if (code != 0)
    return true;
  std::string body(out.begin(), out.end());
  size_t pos = 0;
  while (pos < body.size()) {
    size_t nl = body.find('\n', pos);
    std::string t = trim(body.substr(
        pos, nl == std::string::npos ? std::string::npos : nl - pos));
    if (!t.empty())
      types.push_back(t);
    if (nl == std::string::npos)
      break;
    pos = nl + 1;
  }
  return true;
}

bool CommandClipboard::read_type(const std::string &type,
                                 std::vector<uint8_t> &out) {
  int code = 0;
  if (!run_process(read_cmd(type), nullptr, &out, code) || code != 0) {
    Logger::instance().log(LogLevel::DEBUG, "%s: read %s failed (exit %d)",
                           name(), type.c_str(), code);
    return false;
  }
  return true;
}

bool CommandClipboard::write_type(const std::string &type,
                                  const std::vector<uint8_t> &data) {
  int code = 0;
  if (!run_process(write_cmd(type), &data, nullptr, code) || code != 0) {
    Logger::instance().log(LogLevel::WARN, "%s: write %s failed (exit %d)",
                           name(), type.c_str(), code);
    return false;
  }
  return true;
}

bool CommandClipboard::read_text(std::string &out) {
  out.clear();
  std::vector<std::string> types;
  if (!list_types(types))
    return false;
  for (const auto &want : text_types()) {
    if (std::find(types.begin(), types.end(), want) == types.end())
      continue;
    std::vector<uint8_t> raw;
    if (!read_type(want, raw))
      return false;
    std::string text(raw.begin(), raw.end());
    if (!is_valid_utf8(text)) {
      Logger::instance().log(LogLevel::DEBUG, "%s: ignoring non-utf8 text",
                             name());
      return true;
    }
    out = std::move(text);
    return true;
  }
  return true;
}

bool CommandClipboard::write_text(const std::string &text) {
  return write_type(text_types().front(),
                    std::vector<uint8_t>(text.begin(), text.end()));
}

bool CommandClipboard::read_image(ImageData &out) {
  out = ImageData{};
  std::vector<std::string> types;
  if (!list_types(types))
    return false;
  std::string chosen;
  for (const auto &t : types) {
    if (t == "image/png") {
      chosen = t;
      break;
    }
    if (chosen.empty() && t.compare(0, 6, "image/") == 0)
      chosen = t;
  }
  if (chosen.empty())
    return true;
  if (!read_type(chosen, out.bytes))
    return false;
  out.encoding = chosen;
  return true;
}

static bool safe_mime(const std::string &t) {
  if (t.empty() || t.size() > 64)
    return false;
  for (unsigned char c : t)
    if (!(std::isalnum(c) || c == '/' || c == '+' || c == '-' || c == '.'))
      return false;
  return true;
}

bool CommandClipboard::write_image(const ImageData &img) {
  if (!safe_mime(img.encoding) || img.encoding.compare(0, 6, "image/") != 0) {
    Logger::instance().log(LogLevel::WARN, "%s: refusing image type '%s'",
                           name(), img.encoding.c_str());
    return false;
  }
  return write_type(img.encoding, img.bytes);
}

bool CommandClipboard::read_files(std::vector<std::string> &paths) {
  paths.clear();
  std::vector<std::string> types;
  if (!list_types(types))
    return false;
  if (std::find(types.begin(), types.end(), "text/uri-list") == types.end())
    return true;
  std::vector<uint8_t> raw;
  if (!read_type("text/uri-list", raw))
    return false;
  paths = parse_uri_list(std::string(raw.begin(), raw.end()));
  return true;
}

bool CommandClipboard::write_files(const std::vector<std::string> &paths) {
  std::string body = make_uri_list(paths);
  return write_type("text/uri-list",
                    std::vector<uint8_t>(body.begin(), body.end()));
}

std::vector<std::string> WaylandClipboard::list_types_cmd() const {
  return {"wl-paste", "--list-types"};
}

std::vector<std::string>
WaylandClipboard::read_cmd(const std::string &type) const {
  return {"wl-paste", "--no-newline", "--type", type};
}

std::vector<std::string>
WaylandClipboard::write_cmd(const std::string &type) const {
  return {"wl-copy", "--type", type};
}

const std::vector<std::string> &WaylandClipboard::text_types() const {
  static const std::vector<std::string> types = {
      "text/plain;charset=utf-8", "UTF8_STRING", "text/plain", "STRING",
      "TEXT"};
  return types;
}

std::vector<std::string> X11Clipboard::list_types_cmd() const {
  return {"xclip", "-selection", "clipboard", "-o", "-t", "TARGETS"};
}

std::vector<std::string> X11Clipboard::read_cmd(const std::string &type) const {
  return {"xclip", "-selection", "clipboard", "-o", "-t", type};
}

std::vector<std::string>
X11Clipboard::write_cmd(const std::string &type) const {
  return {"xclip", "-selection", "clipboard", "-i", "-t", type};
}

const std::vector<std::string> &X11Clipboard::text_types() const {
  static const std::vector<std::string> types = {
      "UTF8_STRING", "text/plain;charset=utf-8", "text/plain", "STRING",
      "TEXT"};
  return types;
}

} // namespace clipmesh
