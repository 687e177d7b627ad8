#pragma once

#include "calls/audio.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace parley {
namespace test {

// Shared record of what the fake audio pair saw
struct FakeAudioLog {
  std::mutex mutex;
  std::vector<std::vector<uint8_t>> played;
  std::atomic<int> senders_created{0};
  std::atomic<int> receivers_created{0};
  std::atomic<int> senders_running{0};
  std::atomic<int> receivers_running{0};
  std::atomic<bool> muted{false};
  calls::CallParams last_params;

  size_t played_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return played.size();
  }
};

// Sender that only emits frames when the test calls emit()
class FakeAudioSender : public calls::AudioSender {
public:
  FakeAudioSender(std::shared_ptr<FakeAudioLog> log, calls::PacketSink sink)
      : log_(std::move(log)), sink_(std::move(sink)) {}

  ~FakeAudioSender() override { stop(); }

  void start() override {
    if (!running_.exchange(true)) {
      log_->senders_running++;
    }
  }
  void stop() override {
    if (running_.exchange(false)) {
      log_->senders_running--;
    }
  }
  void set_mute(bool mute) override { log_->muted = mute; }

  bool emit(const std::vector<uint8_t> &frame) {
    return running_ && !log_->muted && sink_(frame);
  }

private:
  std::shared_ptr<FakeAudioLog> log_;
  calls::PacketSink sink_;
  std::atomic<bool> running_{false};
};

class FakeAudioReceiver : public calls::AudioReceiver {
public:
  explicit FakeAudioReceiver(std::shared_ptr<FakeAudioLog> log)
      : log_(std::move(log)) {}

  ~FakeAudioReceiver() override { stop(); }

  void start() override {
    if (!running_.exchange(true)) {
      log_->receivers_running++;
    }
  }
  void stop() override {
    if (running_.exchange(false)) {
      log_->receivers_running--;
    }
  }
  void push_packet(std::vector<uint8_t> frame) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->played.push_back(std::move(frame));
  }

private:
  std::shared_ptr<FakeAudioLog> log_;
  std::atomic<bool> running_{false};
};

class FakeAudioFactory : public calls::AudioFactory {
public:
  FakeAudioFactory() : log(std::make_shared<FakeAudioLog>()) {}

  std::unique_ptr<calls::AudioSender>
  create_sender(const calls::CallParams &params,
                calls::PacketSink sink) override {
    log->senders_created++;
    {
      std::lock_guard<std::mutex> lock(log->mutex);
      log->last_params = params;
    }
    auto sender = std::make_unique<FakeAudioSender>(log, std::move(sink));
    last_sender = sender.get();
    return sender;
  }

  std::unique_ptr<calls::AudioReceiver>
  create_receiver(const calls::CallParams &params) override {
    log->receivers_created++;
    return std::make_unique<FakeAudioReceiver>(log);
  }

  std::shared_ptr<FakeAudioLog> log;
  // Valid while the call that created it is running
  FakeAudioSender *last_sender{nullptr};
};

} // namespace test
} // namespace parley
