#include "status_message.hpp"
#include <utility>

StatusMessage::StatusMessage(std::chrono::seconds timeout) : timeout_(timeout) {}

void StatusMessage::set(std::string message) {
  text_ = std::move(message);
  set_time_ = Clock::now();
}

std::optional<std::string> StatusMessage::message(Clock::time_point now) {
  if (!set_time_) return std::nullopt;
  if (now - *set_time_ > timeout_) {
    set_time_.reset();
    text_.clear();
    return std::nullopt;
  }
  return text_;
}
