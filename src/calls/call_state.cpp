#include "calls/call_state.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"

namespace parley {
namespace calls {

std::string call_status_name(CallStatus status) {
  switch (status) {
  case CallStatus::IDLE:
    return "idle";
  case CallStatus::CALL:
    return "call";
  case CallStatus::CALLING:
    return "calling";
  case CallStatus::RECEIVING:
    return "receiving";
  case CallStatus::ANSWER:
    return "answer";
  case CallStatus::REJECT:
    return "reject";
  case CallStatus::IN_CALL:
    return "in_call";
  case CallStatus::HANGUP:
    return "hangup";
  }
  return "unknown";
}

bool is_call_active(CallStatus status) {
  switch (status) {
  case CallStatus::CALL:
  case CallStatus::CALLING:
  case CallStatus::RECEIVING:
  case CallStatus::ANSWER:
  case CallStatus::IN_CALL:
    return true;
  default:
    return false;
  }
}

CallSignalState::CallSignalState(std::shared_ptr<AudioFactory> audio,
                                 CallParams params, Hooks hooks)
    : audio_factory_(std::move(audio)), params_(params), local_params_(params),
      hooks_(std::move(hooks)) {}

CallSignalState::~CallSignalState() { stop_audio(); }

void CallSignalState::post(Command cmd) {
  std::lock_guard<std::mutex> lock(commands_mutex_);
  commands_.push_back(cmd);
}

void CallSignalState::post_start() { post({CommandType::START, false}); }

void CallSignalState::post_answer(bool accept) {
  post({CommandType::ANSWER, accept});
}

void CallSignalState::post_hangup() { post({CommandType::HANGUP, false}); }

void CallSignalState::post_mute(bool mute) { post({CommandType::MUTE, mute}); }

void CallSignalState::set_status(CallStatus status, bool notify) {
  CallStatus old = status_.exchange(status);
  if (old != status) {
    LOG_CALL_DEBUG("call status {} -> {}", call_status_name(old),
                   call_status_name(status));
  }
  if (notify && hooks_.on_status) {
    hooks_.on_status(status);
  }
}

bool CallSignalState::apply(const Command &cmd) {
  CallStatus current = status_.load();
  switch (cmd.type) {
  case CommandType::START:
    if (current != CallStatus::IDLE) {
      LOG_CALL_WARN("start_call ignored, call status is {}",
                    call_status_name(current));
      return true;
    }
    params_ = local_params_;
    set_status(CallStatus::CALL, false);
    return true;

  case CommandType::ANSWER:
    if (current != CallStatus::RECEIVING) {
      LOG_CALL_WARN("answer_call ignored, call status is {}",
                    call_status_name(current));
      return true;
    }
    set_status(cmd.flag ? CallStatus::ANSWER : CallStatus::REJECT, false);
    return true;

  case CommandType::HANGUP: {
    if (!is_call_active(current)) {
      LOG_CALL_DEBUG("hangup_call ignored, no active call");
      return true;
    }
    bool sent = true;
    // An offer that never left has nothing to cancel on the other side
    if (current != CallStatus::CALL) {
      sent = hooks_.send(message::CallHangMessage());
    }
    end_call("local hangup");
    return sent;
  }

  case CommandType::MUTE: {
    muted_ = cmd.flag;
    std::lock_guard<std::mutex> lock(audio_mutex_);
    if (sender_) {
      sender_->set_mute(muted_);
    }
    return true;
  }
  }
  return true;
}

bool CallSignalState::tick() {
  std::deque<Command> pending;
  {
    std::lock_guard<std::mutex> lock(commands_mutex_);
    pending.swap(commands_);
  }
  for (const auto &cmd : pending) {
    if (!apply(cmd)) {
      return false;
    }
  }

  switch (status_.load()) {
  case CallStatus::CALL: {
    message::CallOfferMessage offer;
    offer.mime_type = params_.mime_type;
    offer.sample_rate = params_.sample_rate;
    offer.channels = params_.channels;
    if (!hooks_.send(offer)) {
      return false;
    }
    LOG_CALL_INFO("call offer sent ({} {} Hz)", offer.mime_type,
                  offer.sample_rate);
    set_status(CallStatus::CALLING, true);
    return true;
  }
  case CallStatus::ANSWER:
    if (!hooks_.send(message::CallAnswerMessage(true))) {
      return false;
    }
    LOG_CALL_INFO("call accepted");
    start_audio();
    set_status(CallStatus::IN_CALL, true);
    return true;
  case CallStatus::REJECT:
    if (!hooks_.send(message::CallAnswerMessage(false))) {
      return false;
    }
    LOG_CALL_INFO("call rejected");
    end_call("local reject");
    return true;
  default:
    return true;
  }
}

void CallSignalState::on_offer(const message::CallOfferMessage &offer) {
  CallStatus current = status_.load();
  if (current != CallStatus::IDLE) {
    LOG_CALL_WARN("call offer ignored, call status is {}",
                  call_status_name(current));
    return;
  }
  params_.mime_type = offer.mime_type;
  params_.sample_rate = offer.sample_rate;
  params_.channels = offer.channels;
  LOG_CALL_INFO("incoming call ({} {} Hz x{})", offer.mime_type,
                offer.sample_rate, offer.channels);
  set_status(CallStatus::RECEIVING, false);
  if (hooks_.on_incoming) {
    hooks_.on_incoming();
  }
}

bool CallSignalState::on_answer(bool ok) {
  CallStatus current = status_.load();
  if (current != CallStatus::CALLING) {
    LOG_CALL_WARN("call answer ignored, call status is {}",
                  call_status_name(current));
    return false;
  }
  if (ok) {
    LOG_CALL_INFO("peer accepted the call");
    start_audio();
    set_status(CallStatus::IN_CALL, true);
  } else {
    end_call("peer rejected");
  }
  return true;
}

void CallSignalState::on_hangup() {
  if (!is_call_active(status_.load())) {
    LOG_CALL_DEBUG("hangup ignored, no active call");
    return;
  }
  end_call("peer hangup");
}

void CallSignalState::on_packet(std::vector<uint8_t> frame) {
  std::lock_guard<std::mutex> lock(audio_mutex_);
  if (receiver_) {
    receiver_->push_packet(std::move(frame));
  }
}

void CallSignalState::loop_packet(std::vector<uint8_t> frame) {
  on_packet(std::move(frame));
}

bool CallSignalState::shutdown() {
  bool was_active = is_call_active(status_.load());
  if (was_active) {
    end_call("connection closed");
  } else {
    stop_audio();
  }
  return was_active;
}

bool CallSignalState::has_audio() const {
  std::lock_guard<std::mutex> lock(audio_mutex_);
  return sender_ != nullptr || receiver_ != nullptr;
}

void CallSignalState::end_call(const char *why) {
  LOG_CALL_INFO("call ended: {}", why);
  stop_audio();
  set_status(CallStatus::HANGUP, true);
  set_status(CallStatus::IDLE, false);
}

void CallSignalState::start_audio() {
  std::lock_guard<std::mutex> lock(audio_mutex_);
  if (!audio_factory_ || sender_ || receiver_) {
    return;
  }
  receiver_ = audio_factory_->create_receiver(params_);
  sender_ = audio_factory_->create_sender(params_, hooks_.send_packet);
  if (receiver_) {
    receiver_->start();
  }
  if (sender_) {
    sender_->set_mute(muted_);
    sender_->start();
  }
}

void CallSignalState::stop_audio() {
  std::unique_ptr<AudioSender> sender;
  std::unique_ptr<AudioReceiver> receiver;
  {
    std::lock_guard<std::mutex> lock(audio_mutex_);
    sender = std::move(sender_);
    receiver = std::move(receiver_);
  }
  if (sender) {
    sender->stop();
  }
  if (receiver) {
    receiver->stop();
  }
}

} // namespace calls
} // namespace parley
