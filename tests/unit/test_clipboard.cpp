/**
 * @file test_clipboard.cpp
 * @brief Unit tests for clipboard formats, the owner thread and the Linux
 *        command backend
 */

#include <clipsync/clipsync.h>
#include <gtest/gtest.h>

#include "fake_clipboard.h"
#include "platform/linux/clipboard_linux.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace clipsync;
using clipsync::testing::FakeClipboard;
using clipsync::testing::FakeClipboardState;
namespace fs = std::filesystem;

class ClipboardTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(security_init().is_ok());
    formats_ = register_formats();
    state_ = std::make_shared<FakeClipboardState>();
  }

  std::unique_ptr<ClipboardOwner> make_owner() {
    return std::make_unique<ClipboardOwner>(
        std::make_unique<FakeClipboard>(state_));
  }

  ClipboardFormats formats_;
  std::shared_ptr<FakeClipboardState> state_;
};

// ============================================================================
// Formats
// ============================================================================

TEST_F(ClipboardTest, RegisteredFormatsAreDistinct) {
  EXPECT_EQ(formats_.text, FORMAT_UNICODE_TEXT);
  EXPECT_EQ(formats_.dib, FORMAT_DIB);
  EXPECT_NE(formats_.png, 0u);
  EXPECT_NE(formats_.image_png, 0u);
  EXPECT_NE(formats_.png, formats_.image_png);
  EXPECT_NE(formats_.png, formats_.text);
}

TEST_F(ClipboardTest, TextRecognition) {
  Item by_id = Item::from_bytes(FORMAT_UNICODE_TEXT, Bytes{'a'});
  Item by_mime = Item::from_bytes(1, Bytes{'a'}, "", "text/plain");
  Item other = Item::from_bytes(FORMAT_DIB, Bytes{1, 2});

  EXPECT_TRUE(formats_.is_text(by_id));
  EXPECT_TRUE(formats_.is_text(by_mime));
  EXPECT_FALSE(formats_.is_text(other));
}

TEST_F(ClipboardTest, PngRecognition) {
  Bytes magic = {0x89, 0x50, 0x4E, 0x47};

  EXPECT_TRUE(formats_.is_png(Item::from_bytes(formats_.png, magic)));
  EXPECT_TRUE(formats_.is_png(Item::from_bytes(formats_.image_png, magic)));
  // A peer may use its own id for the same named format
  EXPECT_TRUE(formats_.is_png(Item::from_bytes(49999, magic, "PNG")));
  EXPECT_TRUE(formats_.is_png(Item::from_bytes(7, magic, "", "image/png")));

  EXPECT_FALSE(formats_.is_png(Item::from_bytes(FORMAT_DIB, magic)));

  // Unregistered formats must not match an item with fmt 0
  ClipboardFormats unregistered;
  EXPECT_FALSE(unregistered.is_png(Item::from_bytes(0, magic)));
}

TEST_F(ClipboardTest, MakeTextItem) {
  Item item = make_text_item(formats_, "Hello, world!");

  EXPECT_EQ(item.fmt, FORMAT_UNICODE_TEXT);
  EXPECT_EQ(item.fmt_name, "CF_UNICODETEXT");
  EXPECT_EQ(item.mime_type, "text/plain");
  EXPECT_EQ(item.byte_len, 13u);
  EXPECT_EQ(item.payload, base64_encode(std::string("Hello, world!")));
}

TEST_F(ClipboardTest, MakePngItem) {
  Bytes png = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
  Item item = make_png_item(formats_, png);

  EXPECT_EQ(item.fmt, formats_.png);
  EXPECT_EQ(item.fmt_name, "PNG");
  EXPECT_EQ(item.mime_type, "image/png");
  EXPECT_EQ(item.byte_len, png.size());
  EXPECT_EQ(item.decode_payload().value(), png);
}

// ============================================================================
// Clipboard Owner
// ============================================================================

TEST_F(ClipboardTest, OwnerNotRunning) {
  auto owner = make_owner();
  EXPECT_FALSE(owner->is_running());

  auto read = owner->read();
  ASSERT_TRUE(read.is_error());
  EXPECT_EQ(read.error().code, ErrorCode::ClipboardUnavailable);

  auto written = owner->write({make_text_item(formats_, "x")});
  ASSERT_TRUE(written.is_error());
  EXPECT_EQ(written.error().code, ErrorCode::ClipboardUnavailable);
}

TEST_F(ClipboardTest, OwnerWithoutBackend) {
  ClipboardOwner owner(nullptr);
  auto started = owner.start();
  ASSERT_TRUE(started.is_error());
  EXPECT_EQ(started.error().code, ErrorCode::ClipboardUnavailable);
}

TEST_F(ClipboardTest, OwnerForwardsOnItsThread) {
  auto owner = make_owner();
  ASSERT_TRUE(owner->start().is_ok());
  EXPECT_TRUE(owner->is_running());

  std::vector<Item> items = {make_text_item(formats_, "copied")};
  ASSERT_TRUE(owner->write(items).is_ok());
  EXPECT_NE(state_->last_thread, std::this_thread::get_id());

  auto read = owner->read();
  ASSERT_TRUE(read.is_ok());
  ASSERT_EQ(read.value().size(), 1u);
  EXPECT_EQ(read.value()[0], items[0]);
  EXPECT_EQ(state_->write_count(), 1u);

  owner->stop();
}

TEST_F(ClipboardTest, OwnerPassesBackendErrors) {
  auto owner = make_owner();
  ASSERT_TRUE(owner->start().is_ok());

  state_->fail_writes = true;
  auto written = owner->write({make_text_item(formats_, "x")});
  ASSERT_TRUE(written.is_error());
  EXPECT_EQ(written.error().code, ErrorCode::PlatformError);
}

TEST_F(ClipboardTest, OwnerConcurrentCallers) {
  auto owner = make_owner();
  ASSERT_TRUE(owner->start().is_ok());

  std::vector<std::thread> callers;
  std::atomic<int> ok{0};
  for (int t = 0; t < 4; ++t) {
    callers.emplace_back([&, t] {
      for (int i = 0; i < 25; ++i) {
        std::string text = std::to_string(t) + ":" + std::to_string(i);
        if (owner->write({make_text_item(formats_, text)}).is_ok() &&
            owner->read().is_ok()) {
          ok++;
        }
      }
    });
  }
  for (auto &c : callers) {
    c.join();
  }

  EXPECT_EQ(ok.load(), 100);
  EXPECT_EQ(state_->write_count(), 100u);
}

TEST_F(ClipboardTest, OwnerStopAndRestart) {
  auto owner = make_owner();
  ASSERT_TRUE(owner->start().is_ok());
  EXPECT_EQ(owner->start().error().code, ErrorCode::InvalidState);

  owner->stop();
  EXPECT_FALSE(owner->is_running());
  EXPECT_EQ(owner->read().error().code, ErrorCode::ClipboardUnavailable);
  owner->stop();

  ASSERT_TRUE(owner->start().is_ok());
  EXPECT_TRUE(owner->read().is_ok());
}

// ============================================================================
// Linux Command Backend
// ============================================================================

class LinuxClipboardTest : public ClipboardTest {
protected:
  void SetUp() override {
    ClipboardTest::SetUp();
    dir_ = fs::temp_directory_path() /
           ("clipsync_clipboard_test_" + std::to_string(::getpid()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  /// Commands that keep the "clipboard" in files under dir_
  platform::ClipboardCommands file_commands(bool with_png) const {
    std::string d = dir_.string();
    platform::ClipboardCommands c;
    c.read_text = "cat '" + d + "/text' 2>/dev/null";
    c.write_text = "cat > '" + d + "/text'";
    if (with_png) {
      c.list_types = "cat '" + d + "/types' 2>/dev/null";
      c.read_png = "cat '" + d + "/png' 2>/dev/null";
      c.write_png = "cat > '" + d + "/png'";
    }
    return c;
  }

  void put(const std::string &name, const std::string &content) const {
    std::ofstream out(dir_ / name, std::ios::binary);
    out << content;
  }

  std::string get(const std::string &name) const {
    std::ifstream in(dir_ / name, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  fs::path dir_;
};

TEST_F(LinuxClipboardTest, EmptyClipboardReadsNothing) {
  platform::LinuxClipboard cb(formats_, file_commands(true), "files");
  auto read = cb.read();
  ASSERT_TRUE(read.is_ok());
  EXPECT_TRUE(read.value().empty());
  EXPECT_EQ(cb.name(), "files");
}

TEST_F(LinuxClipboardTest, ReadsText) {
  put("text", "from the desktop");
  platform::LinuxClipboard cb(formats_, file_commands(true), "files");

  auto read = cb.read();
  ASSERT_TRUE(read.is_ok());
  ASSERT_EQ(read.value().size(), 1u);
  EXPECT_EQ(read.value()[0], make_text_item(formats_, "from the desktop"));
}

TEST_F(LinuxClipboardTest, PrefersPngWhenOffered) {
  std::string png("\x89PNG\r\n\x1a\n\0\0data", 14);
  put("types", "text/plain\nimage/png\n");
  put("png", png);
  put("text", "ignored");
  platform::LinuxClipboard cb(formats_, file_commands(true), "files");

  auto read = cb.read();
  ASSERT_TRUE(read.is_ok());
  ASSERT_EQ(read.value().size(), 1u);
  EXPECT_TRUE(formats_.is_png(read.value()[0]));
  EXPECT_EQ(read.value()[0].byte_len, png.size());
  EXPECT_EQ(read.value()[0].decode_payload().value(),
            Bytes(png.begin(), png.end()));
}

TEST_F(LinuxClipboardTest, WritesPngFirst) {
  platform::LinuxClipboard cb(formats_, file_commands(true), "files");
  Bytes png = {0x89, 'P', 'N', 'G', 0x00, 0x01};

  ASSERT_TRUE(cb.write({make_text_item(formats_, "alt text"),
                        make_png_item(formats_, png)})
                  .is_ok());
  EXPECT_EQ(get("png"), std::string(png.begin(), png.end()));
  EXPECT_FALSE(fs::exists(dir_ / "text"));
}

TEST_F(LinuxClipboardTest, WritesText) {
  platform::LinuxClipboard cb(formats_, file_commands(false), "files");
  ASSERT_TRUE(cb.write({make_text_item(formats_, "pasted")}).is_ok());
  EXPECT_EQ(get("text"), "pasted");
}

TEST_F(LinuxClipboardTest, TextOnlyToolRejectsImages) {
  platform::LinuxClipboard cb(formats_, file_commands(false), "files");
  auto written = cb.write({make_png_item(formats_, Bytes{1, 2, 3})});
  ASSERT_TRUE(written.is_error());
  EXPECT_EQ(written.error().code, ErrorCode::UnsupportedFormat);
}

TEST_F(LinuxClipboardTest, UnknownFormatsOnly) {
  platform::LinuxClipboard cb(formats_, file_commands(true), "files");
  auto written = cb.write({Item::from_bytes(FORMAT_DIB, Bytes{1, 2})});
  ASSERT_TRUE(written.is_error());
  EXPECT_EQ(written.error().code, ErrorCode::UnsupportedFormat);
}

TEST_F(LinuxClipboardTest, FailingCommandIsReported) {
  platform::ClipboardCommands c = file_commands(false);
  c.write_text = "cat > /dev/null; exit 3";
  platform::LinuxClipboard cb(formats_, c, "files");

  auto written = cb.write({make_text_item(formats_, "x")});
  ASSERT_TRUE(written.is_error());
  EXPECT_EQ(written.error().code, ErrorCode::PlatformError);
}

TEST_F(LinuxClipboardTest, HeadlessSessionNotSupported) {
  auto commands = platform::resolve_clipboard_commands(
      platform::DisplayServer::None);
  ASSERT_TRUE(commands.is_error());
  EXPECT_EQ(commands.error().code, ErrorCode::NotSupported);
}
