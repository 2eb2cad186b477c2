/**
 * @file clipboard_linux.cpp
 * @brief Linux clipboard implementation
 *
 * Implements clipboard access using command-line tools (xclip, xsel,
 * wl-clipboard) so that it works under both X11 and Wayland sessions.
 */

#include "clipboard_linux.h"
#include "clipsync/log.h"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sys/wait.h>

namespace clipsync {
namespace platform {

// ============================================================================
// Display Server Detection
// ============================================================================

DisplayServer detect_display_server() {
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && wayland[0] != '\0') {
    return DisplayServer::Wayland;
  }

  const char *display = std::getenv("DISPLAY");
  if (display && display[0] != '\0') {
    return DisplayServer::X11;
  }

  return DisplayServer::None;
}

// ============================================================================
// Command Execution Helpers
// ============================================================================

namespace {

struct PipeCloser {
  void operator()(FILE *f) const {
    if (f) {
      pclose(f);
    }
  }
};

/// Exit status of a finished pclose(), -1 when the child did not exit
int exit_status(int raw) {
  if (raw == -1 || !WIFEXITED(raw)) {
    return -1;
  }
  return WEXITSTATUS(raw);
}

/**
 * @brief Run a command and capture its binary output
 *
 * A non-zero exit status is reported as an empty output; the tools use it
 * for "nothing of that type on the clipboard".
 */
Result<std::string> execute_command(const std::string &cmd) {
  FILE *raw = popen(cmd.c_str(), "r");
  if (!raw) {
    return Error(ErrorCode::PlatformError, "Failed to execute command: " + cmd);
  }
  std::unique_ptr<FILE, PipeCloser> pipe(raw);

  std::array<char, 64 * 1024> buffer;
  std::string result;
  size_t n;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
    result.append(buffer.data(), n);
  }

  int status = exit_status(pclose(pipe.release()));
  if (status != 0) {
    return std::string();
  }
  return result;
}

/**
 * @brief Run a command with input data
 */
Result<void> execute_command_with_input(const std::string &cmd,
                                        const std::string &input) {
  FILE *raw = popen(cmd.c_str(), "w");
  if (!raw) {
    return Error(ErrorCode::PlatformError, "Failed to execute command: " + cmd);
  }
  std::unique_ptr<FILE, PipeCloser> pipe(raw);

  if (fwrite(input.data(), 1, input.size(), pipe.get()) != input.size()) {
    return Error(ErrorCode::PlatformError, "Failed to write to pipe", cmd);
  }

  int status = exit_status(pclose(pipe.release()));
  if (status != 0) {
    return Error(ErrorCode::PlatformError, "Clipboard command failed",
                 cmd + " exited with " + std::to_string(status));
  }
  return Result<void>::ok();
}

bool command_exists(const char *cmd) {
  std::string check = "command -v ";
  check += cmd;
  check += " >/dev/null 2>&1";
  return std::system(check.c_str()) == 0;
}

} // namespace

// ============================================================================
// Tool Selection
// ============================================================================

Result<ClipboardCommands> resolve_clipboard_commands(DisplayServer server) {
  ClipboardCommands c;

  if (server == DisplayServer::Wayland) {
    if (!command_exists("wl-paste") || !command_exists("wl-copy")) {
      return Error(ErrorCode::NotSupported,
                   "wl-paste/wl-copy not found. Install wl-clipboard package.");
    }
    c.list_types = "wl-paste --list-types 2>/dev/null";
    c.read_text = "wl-paste --no-newline --type text/plain 2>/dev/null";
    c.write_text = "wl-copy --type text/plain 2>/dev/null";
    c.read_png = "wl-paste --type image/png 2>/dev/null";
    c.write_png = "wl-copy --type image/png 2>/dev/null";
    return c;
  }

  if (server == DisplayServer::X11) {
    if (command_exists("xclip")) {
      c.list_types = "xclip -selection clipboard -t TARGETS -o 2>/dev/null";
      c.read_text = "xclip -selection clipboard -o 2>/dev/null";
      c.write_text = "xclip -selection clipboard 2>/dev/null";
      c.read_png = "xclip -selection clipboard -t image/png -o 2>/dev/null";
      c.write_png = "xclip -selection clipboard -t image/png 2>/dev/null";
      return c;
    }
    if (command_exists("xsel")) {
      // xsel handles text only
      c.read_text = "xsel --clipboard --output 2>/dev/null";
      c.write_text = "xsel --clipboard --input 2>/dev/null";
      return c;
    }
    return Error(ErrorCode::NotSupported,
                 "xclip or xsel not found. Install one of them.");
  }

  return Error(ErrorCode::NotSupported,
               "No display server detected (headless mode?)");
}

// ============================================================================
// LinuxClipboard
// ============================================================================

LinuxClipboard::LinuxClipboard(ClipboardFormats formats,
                               ClipboardCommands commands, std::string tool)
    : formats_(formats), commands_(std::move(commands)),
      tool_(std::move(tool)) {}

bool LinuxClipboard::offers_png() {
  if (commands_.read_png.empty() || commands_.list_types.empty()) {
    return false;
  }
  auto types = execute_command(commands_.list_types);
  if (types.is_error()) {
    return false;
  }
  return types.value().find(MIME_PNG) != std::string::npos;
}

Result<std::vector<Item>> LinuxClipboard::read() {
  std::vector<Item> items;

  if (offers_png()) {
    auto png = execute_command(commands_.read_png);
    CLIPSYNC_TRY(png);
    if (!png.value().empty()) {
      const std::string &data = png.value();
      items.push_back(make_png_item(formats_, Bytes(data.begin(), data.end())));
      return items;
    }
  }

  auto text = execute_command(commands_.read_text);
  CLIPSYNC_TRY(text);
  if (!text.value().empty()) {
    items.push_back(make_text_item(formats_, text.value()));
  }
  return items;
}

Result<void> LinuxClipboard::write(const std::vector<Item> &items) {
  // The tools own a single representation at a time; prefer the image
  const Item *png = nullptr;
  const Item *text = nullptr;
  for (const auto &item : items) {
    if (item.payload.empty()) {
      continue;
    }
    if (!png && formats_.is_png(item)) {
      png = &item;
    } else if (!text && formats_.is_text(item)) {
      text = &item;
    } else {
      logger()->trace("skipping clipboard item of format {}", item.fmt);
    }
  }

  if (png && !commands_.write_png.empty()) {
    auto data = png->decode_payload();
    CLIPSYNC_TRY(data);
    std::string input(data.value().begin(), data.value().end());
    return execute_command_with_input(commands_.write_png, input);
  }

  if (text) {
    auto data = text->decode_payload();
    CLIPSYNC_TRY(data);
    std::string input(data.value().begin(), data.value().end());
    return execute_command_with_input(commands_.write_text, input);
  }

  if (png) {
    return Error(ErrorCode::UnsupportedFormat,
                 tool_ + " cannot place images on the clipboard");
  }
  return Error(ErrorCode::UnsupportedFormat, "no writable item in snapshot");
}

} // namespace platform

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<ClipboardBackend>>
create_clipboard_backend(const ClipboardFormats &formats) {
  auto server = platform::detect_display_server();
  auto commands = platform::resolve_clipboard_commands(server);
  CLIPSYNC_TRY(commands);

  std::string tool = commands.value().write_text.substr(
      0, commands.value().write_text.find(' '));
  logger()->debug("clipboard backend: {}", tool);

  return std::unique_ptr<ClipboardBackend>(std::make_unique<platform::LinuxClipboard>(
      formats, std::move(commands.value()), std::move(tool)));
}

} // namespace clipsync
