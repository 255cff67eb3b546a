#pragma once

#include <mutex>
#include <string>

namespace crumbtrail::session {

/*
  Current session id, shared by the recording, crash and upload paths.
*/
class Session {
 public:
  Session();
  explicit Session(std::string id);

  std::string Id() const;

  // Starts a new session and returns its id.
  std::string Rotate();

 private:
  mutable std::mutex mutex_;
  std::string        id_;
};

} // namespace crumbtrail::session
