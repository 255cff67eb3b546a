#pragma once

#include <exception>
#include <memory>

#include "internal/crash/crash_handler.hpp"

namespace crumbtrail::crash {

/*
  Adapts a std::terminate_handler to the UncaughtExceptionHandler chain.

  Never returns: it runs the wrapped handler and aborts if that handler
  comes back.
*/
class TerminateHandlerDelegate final : public UncaughtExceptionHandler {
 public:
  explicit TerminateHandlerDelegate(std::terminate_handler handler) : handler_(handler) {
  }

  void UncaughtException(const std::string& thread_name, std::exception_ptr error) override;

 private:
  std::terminate_handler handler_;
};

/*
  Process-wide std::terminate registration.

  Typical wiring:
    auto previous = TerminateHook::PreviousDelegate();
    auto handler  = std::make_shared<CrashHandler>(..., previous);
    TerminateHook::Install(handler);
*/
class TerminateHook {
 public:
  // The terminate handler that was active before Install().
  static UncaughtExceptionHandlerPtr PreviousDelegate();

  static void Install(UncaughtExceptionHandlerPtr handler);
  static void Uninstall();
  static bool Installed();

 private:
  [[noreturn]] static void OnTerminate();
};

} // namespace crumbtrail::crash
