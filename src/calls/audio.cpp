#include "calls/audio.hpp"
#include "util/logging.hpp"

namespace parley {
namespace calls {

bool PacketQueue::push(std::vector<uint8_t> frame) {
  bool dropped = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (frames_.size() >= capacity_) {
      frames_.pop_front();
      dropped_.fetch_add(1);
      dropped = true;
    }
    frames_.push_back(std::move(frame));
  }
  cv_.notify_one();
  return dropped;
}

std::optional<std::vector<uint8_t>>
PacketQueue::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
  if (frames_.empty()) {
    return std::nullopt;
  }
  auto frame = std::move(frames_.front());
  frames_.pop_front();
  return frame;
}

void PacketQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    frames_.clear();
  }
  cv_.notify_all();
}

size_t PacketQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_.size();
}

namespace {

// 20 ms of Opus DTX silence
const std::vector<uint8_t> kSilenceFrame = {0xF8, 0xFF, 0xFE};

class SilentSender : public AudioSender {
public:
  SilentSender(PacketSink sink, std::chrono::milliseconds interval)
      : sink_(std::move(sink)), interval_(interval) {}

  ~SilentSender() override { stop(); }

  void start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
      return;
    }
    running_ = true;
    thread_ = std::thread([this] { loop(); });
  }

  void stop() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  void set_mute(bool mute) override { muted_.store(mute); }

private:
  void loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      cv_.wait_for(lock, interval_, [this] { return !running_; });
      if (!running_) {
        break;
      }
      lock.unlock();
      // Muted senders still emit silence so the link stays alive
      bool ok = sink_(kSilenceFrame);
      lock.lock();
      if (!ok) {
        LOG_CALL_DEBUG("audio sink closed, stopping silent sender");
        running_ = false;
      }
    }
  }

  PacketSink sink_;
  std::chrono::milliseconds interval_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool running_{false};
  std::atomic<bool> muted_{false};
  std::thread thread_;
};

class SilentReceiver : public AudioReceiver {
public:
  ~SilentReceiver() override { stop(); }

  void start() override {
    if (thread_.joinable()) {
      return;
    }
    thread_ = std::thread([this] {
      while (!stopped_.load()) {
        if (queue_.pop(std::chrono::milliseconds(100))) {
          ++played_;
        }
      }
    });
  }

  void stop() override {
    stopped_.store(true);
    queue_.close();
    if (thread_.joinable()) {
      thread_.join();
    }
    if (played_ > 0) {
      LOG_CALL_DEBUG("silent receiver consumed {} frames, dropped {}", played_,
                     queue_.dropped());
      played_ = 0;
    }
  }

  void push_packet(std::vector<uint8_t> frame) override {
    if (queue_.push(std::move(frame))) {
      LOG_CALL_TRACE("audio queue full, dropped oldest frame");
    }
  }

private:
  PacketQueue queue_;
  std::atomic<bool> stopped_{false};
  uint64_t played_{0};
  std::thread thread_;
};

} // namespace

std::unique_ptr<AudioSender>
SilentAudioFactory::create_sender(const CallParams &params, PacketSink sink) {
  LOG_CALL_DEBUG("creating silent sender ({} {} Hz x{})", params.mime_type,
                 params.sample_rate, params.channels);
  return std::make_unique<SilentSender>(std::move(sink), frame_interval_);
}

std::unique_ptr<AudioReceiver>
SilentAudioFactory::create_receiver(const CallParams &params) {
  (void)params;
  return std::make_unique<SilentReceiver>();
}

} // namespace calls
} // namespace parley
