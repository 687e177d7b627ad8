#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace parley {
namespace calls {

// Codec parameters negotiated by CALL_OFFER
struct CallParams {
  std::string mime_type{"audio/opus"};
  int32_t sample_rate{48000};
  int32_t channels{1};
};

// Where a sender delivers encoded frames. Returns false once the
// connection can no longer carry them.
using PacketSink = std::function<bool(const std::vector<uint8_t> &frame)>;

// Captures and encodes local audio, pushing frames into a PacketSink
class AudioSender {
public:
  virtual ~AudioSender() = default;
  virtual void start() = 0;
  virtual void stop() = 0;
  virtual void set_mute(bool mute) = 0;
};

// Decodes and plays frames received from the peer
class AudioReceiver {
public:
  virtual ~AudioReceiver() = default;
  virtual void start() = 0;
  virtual void stop() = 0;
  virtual void push_packet(std::vector<uint8_t> frame) = 0;
};

// Creates the audio pair for one call
class AudioFactory {
public:
  virtual ~AudioFactory() = default;
  virtual std::unique_ptr<AudioSender> create_sender(const CallParams &params,
                                                     PacketSink sink) = 0;
  virtual std::unique_ptr<AudioReceiver>
  create_receiver(const CallParams &params) = 0;
};

/**
 * PacketQueue - bounded jitter queue between the network and a decoder
 *
 * When full, the oldest frame is dropped: late audio is worth less than
 * fresh audio.
 */
class PacketQueue {
public:
  static constexpr size_t DEFAULT_CAPACITY = 5;

  explicit PacketQueue(size_t capacity = DEFAULT_CAPACITY)
      : capacity_(capacity) {}

  // Returns true if an old frame had to be dropped
  bool push(std::vector<uint8_t> frame);

  // Wait up to timeout for a frame. nullopt on timeout or after close().
  std::optional<std::vector<uint8_t>> pop(std::chrono::milliseconds timeout);

  void close();
  size_t size() const;
  uint64_t dropped() const { return dropped_.load(); }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::vector<uint8_t>> frames_;
  bool closed_{false};
  std::atomic<uint64_t> dropped_{0};
};

/**
 * Audio pair without a sound device, used by the console daemon.
 *
 * The sender emits a silence frame every frame_interval (keeping the
 * in-call idle timer fed); the receiver drains frames and counts them.
 */
class SilentAudioFactory : public AudioFactory {
public:
  explicit SilentAudioFactory(
      std::chrono::milliseconds frame_interval = std::chrono::milliseconds(100))
      : frame_interval_(frame_interval) {}

  std::unique_ptr<AudioSender> create_sender(const CallParams &params,
                                             PacketSink sink) override;
  std::unique_ptr<AudioReceiver>
  create_receiver(const CallParams &params) override;

private:
  std::chrono::milliseconds frame_interval_;
};

} // namespace calls
} // namespace parley
