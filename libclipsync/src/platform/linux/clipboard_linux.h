/**
 * @file clipboard_linux.h
 * @brief Linux clipboard backend internals
 *
 * Clipboard access through the command-line tools of the session's display
 * server: wl-paste/wl-copy on Wayland, xclip or xsel on X11.
 */

#ifndef CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H
#define CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H

#include "clipsync/clipboard.h"
#include "clipsync/error.h"
#include <string>

namespace clipsync {
namespace platform {

/**
 * @brief Display server of the current session
 */
enum class DisplayServer { None, X11, Wayland };

/**
 * @brief Detect the display server from WAYLAND_DISPLAY / DISPLAY
 */
DisplayServer detect_display_server();

/**
 * @brief Command lines used for each clipboard operation
 */
struct ClipboardCommands {
  std::string list_types; // Prints one MIME type per line
  std::string read_text;
  std::string write_text;
  std::string read_png;   // Empty when the tool cannot do images
  std::string write_png;
};

/**
 * @brief Pick commands for the installed tools
 *
 * @return Commands, or NotSupported when no display server or tool is found
 */
Result<ClipboardCommands> resolve_clipboard_commands(DisplayServer server);

/**
 * @brief ClipboardBackend running the resolved commands
 */
class LinuxClipboard : public ClipboardBackend {
public:
  LinuxClipboard(ClipboardFormats formats, ClipboardCommands commands,
                 std::string tool);

  Result<std::vector<Item>> read() override;
  Result<void> write(const std::vector<Item> &items) override;
  std::string name() const override { return tool_; }

private:
  bool offers_png();

  ClipboardFormats formats_;
  ClipboardCommands commands_;
  std::string tool_;
};

} // namespace platform
} // namespace clipsync

#endif // CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H
