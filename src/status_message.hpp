#pragma once
/*
 * StatusMessage
 *
 * Purpose: the editor's log line; one message shown in the message bar
 *          until it is older than the configured timeout.
 */
#include <chrono>
#include <optional>
#include <string>

class StatusMessage {
public:
  using Clock = std::chrono::steady_clock;

  explicit StatusMessage(std::chrono::seconds timeout);

  void set(std::string message);
  void set_timeout(std::chrono::seconds timeout) { timeout_ = timeout; }
  /*current text, or nullopt once expired (expiry clears the message)*/
  std::optional<std::string> message(Clock::time_point now = Clock::now());
  const std::string& last() const { return text_; }

private:
  std::string text_;
  std::optional<Clock::time_point> set_time_;
  std::chrono::seconds timeout_;
};
