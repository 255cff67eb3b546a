#include "terminate_hook.hpp"

#include <cstdlib>
#include <mutex>

#include "internal/util/thread.hpp"

namespace crumbtrail::crash {

namespace {

std::mutex                  g_mutex;
UncaughtExceptionHandlerPtr g_handler;
std::terminate_handler      g_previous  = nullptr;
bool                        g_installed = false;

UncaughtExceptionHandlerPtr CurrentHandler() {
  std::lock_guard lock(g_mutex);
  return g_handler;
}

} // namespace

void TerminateHandlerDelegate::UncaughtException(const std::string&, std::exception_ptr) {
  if (handler_) {
    handler_();
  }
  std::abort();
}

UncaughtExceptionHandlerPtr TerminateHook::PreviousDelegate() {
  std::lock_guard lock(g_mutex);
  return std::make_shared<TerminateHandlerDelegate>(g_installed ? g_previous : std::get_terminate());
}

void TerminateHook::Install(UncaughtExceptionHandlerPtr handler) {
  std::lock_guard lock(g_mutex);
  g_handler = std::move(handler);
  if (!g_installed) {
    g_previous  = std::set_terminate(&TerminateHook::OnTerminate);
    g_installed = true;
  }
}

void TerminateHook::Uninstall() {
  std::lock_guard lock(g_mutex);
  if (!g_installed) {
    return;
  }
  std::set_terminate(g_previous);
  g_previous  = nullptr;
  g_installed = false;
  g_handler.reset();
}

bool TerminateHook::Installed() {
  std::lock_guard lock(g_mutex);
  return g_installed;
}

void TerminateHook::OnTerminate() {
  auto error = std::current_exception();
  if (auto handler = CurrentHandler()) {
    handler->UncaughtException(crumbtrail::util::CurrentThreadName(), error);
  }
  std::abort();
}

} // namespace crumbtrail::crash
