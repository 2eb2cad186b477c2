/**
 * @file clipboard.cpp
 * @brief Clipboard formats, item helpers and the owner thread
 */

#include "clipsync/clipboard.h"
#include "clipsync/log.h"
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace clipsync {

// ============================================================================
// Formats
// ============================================================================

namespace {

// Ids handed out for the named formats. They fall in the range other clients
// reserve for registered formats so they never collide with predefined ids.
constexpr uint32_t REGISTERED_FORMAT_BASE = 0xC000;

} // namespace

bool ClipboardFormats::is_text(const Item &item) const {
  return item.fmt == text || item.mime_type == MIME_TEXT;
}

bool ClipboardFormats::is_png(const Item &item) const {
  if (item.fmt != 0 && (item.fmt == png || item.fmt == image_png)) {
    return true;
  }
  return item.fmt_name == "PNG" || item.mime_type == MIME_PNG;
}

ClipboardFormats register_formats() {
  ClipboardFormats formats;
  formats.png = REGISTERED_FORMAT_BASE + 1;
  formats.image_png = REGISTERED_FORMAT_BASE + 2;
  return formats;
}

Item make_text_item(const ClipboardFormats &formats, const std::string &text) {
  Bytes data(text.begin(), text.end());
  return Item::from_bytes(formats.text, data, "CF_UNICODETEXT", MIME_TEXT);
}

Item make_png_item(const ClipboardFormats &formats, const Bytes &png) {
  return Item::from_bytes(formats.png, png, "PNG", MIME_PNG);
}

// ============================================================================
// ClipboardOwner::Impl
// ============================================================================

class ClipboardOwner::Impl {
public:
  enum class RequestKind { Read, Write };

  struct Request {
    RequestKind kind = RequestKind::Read;
    std::vector<Item> items;
    std::promise<Result<std::vector<Item>>> read_reply;
    std::promise<Result<void>> write_reply;
  };

  explicit Impl(std::unique_ptr<ClipboardBackend> b) : backend(std::move(b)) {}

  void run();
  void fail_pending();

  std::unique_ptr<ClipboardBackend> backend;

  mutable std::mutex mutex;
  std::condition_variable cv;
  std::deque<std::unique_ptr<Request>> queue;
  bool running = false;
  bool stopping = false;
  std::thread thread;
};

void ClipboardOwner::Impl::run() {
  for (;;) {
    std::unique_ptr<Request> req;
    {
      std::unique_lock<std::mutex> lock(mutex);
      cv.wait(lock, [this] { return stopping || !queue.empty(); });
      if (stopping) {
        return;
      }
      req = std::move(queue.front());
      queue.pop_front();
    }

    switch (req->kind) {
    case RequestKind::Read:
      req->read_reply.set_value(backend->read());
      break;
    case RequestKind::Write:
      req->write_reply.set_value(backend->write(req->items));
      break;
    }
  }
}

void ClipboardOwner::Impl::fail_pending() {
  std::deque<std::unique_ptr<Request>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex);
    pending.swap(queue);
  }
  for (auto &req : pending) {
    Error err(ErrorCode::Cancelled, "clipboard owner stopped");
    if (req->kind == RequestKind::Read) {
      req->read_reply.set_value(err);
    } else {
      req->write_reply.set_value(err);
    }
  }
}

// ============================================================================
// ClipboardOwner
// ============================================================================

ClipboardOwner::ClipboardOwner(std::unique_ptr<ClipboardBackend> backend)
    : impl_(std::make_unique<Impl>(std::move(backend))) {}

ClipboardOwner::~ClipboardOwner() { stop(); }

Result<void> ClipboardOwner::start() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (!impl_->backend) {
    return Error(ErrorCode::ClipboardUnavailable, "no clipboard backend");
  }
  if (impl_->running) {
    return Error(ErrorCode::InvalidState, "clipboard owner already running");
  }

  impl_->stopping = false;
  impl_->running = true;
  impl_->thread = std::thread([this] { impl_->run(); });
  logger()->debug("clipboard owner started ({})", impl_->backend->name());
  return Result<void>::ok();
}

void ClipboardOwner::stop() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->running) {
      return;
    }
    impl_->stopping = true;
  }
  impl_->cv.notify_all();
  if (impl_->thread.joinable()) {
    impl_->thread.join();
  }
  impl_->fail_pending();

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->running = false;
}

bool ClipboardOwner::is_running() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->running && !impl_->stopping;
}

Result<std::vector<Item>> ClipboardOwner::read() {
  auto req = std::make_unique<Impl::Request>();
  req->kind = Impl::RequestKind::Read;
  auto reply = req->read_reply.get_future();
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->running || impl_->stopping) {
      return Error(ErrorCode::ClipboardUnavailable, "clipboard owner not running");
    }
    impl_->queue.push_back(std::move(req));
  }
  impl_->cv.notify_one();
  return reply.get();
}

Result<void> ClipboardOwner::write(const std::vector<Item> &items) {
  auto req = std::make_unique<Impl::Request>();
  req->kind = Impl::RequestKind::Write;
  req->items = items;
  auto reply = req->write_reply.get_future();
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->running || impl_->stopping) {
      return Error(ErrorCode::ClipboardUnavailable, "clipboard owner not running");
    }
    impl_->queue.push_back(std::move(req));
  }
  impl_->cv.notify_one();
  return reply.get();
}

} // namespace clipsync
