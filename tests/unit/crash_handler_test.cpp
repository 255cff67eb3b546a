#include "internal/crash/crash_handler.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/breadcrumbs/breadcrumb_buffer.hpp"
#include "internal/crash/exception_format.hpp"
#include "internal/crash/terminate_hook.hpp"
#include "internal/session/session.hpp"
#include "internal/storage/event_store.hpp"
#include "internal/util/time.hpp"

namespace {

using crumbtrail::breadcrumbs::BreadcrumbBuffer;
using crumbtrail::crash::CrashHandler;
using crumbtrail::crash::TerminateHook;
using crumbtrail::crash::UncaughtExceptionHandler;
using crumbtrail::model::BreadcrumbCategory;
using crumbtrail::session::Session;
using crumbtrail::storage::EventStore;

class RecordingHandler final : public UncaughtExceptionHandler {
 public:
  void UncaughtException(const std::string& thread_name, std::exception_ptr error) override {
    threads.push_back(thread_name);
    errors.push_back(error);
    if (observe) {
      observe();
    }
  }

  std::vector<std::string>        threads;
  std::vector<std::exception_ptr> errors;
  std::function<void()>           observe;
};

std::filesystem::path FreshRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "crumbtrail_crash_handler_tests" / test_name;
  std::filesystem::remove_all(root);
  return root;
}

std::exception_ptr MakeWrappedError() {
  try {
    try {
      throw std::logic_error("Root cause");
    } catch (...) {
      std::throw_with_nested(std::runtime_error("Wrapper exception"));
    }
  } catch (...) {
    return std::current_exception();
  }
  return nullptr;
}

crumbtrail::v1::Environment TestEnvironment() {
  crumbtrail::v1::Environment env;
  env.set_package_name("com.example.app");
  env.set_os_version("6.1.0");
  env.set_app_version(7);
  return env;
}

void TestCaptureRecordsFatalCrashAndForwards() {
  auto store       = std::make_shared<EventStore>(FreshRoot("capture"));
  auto breadcrumbs = std::make_shared<BreadcrumbBuffer>(10);
  auto session     = std::make_shared<Session>("session-crash");
  auto previous    = std::make_shared<RecordingHandler>();

  breadcrumbs->Add("opened checkout", BreadcrumbCategory::kNavigation);
  breadcrumbs->Add("tapped pay", BreadcrumbCategory::kUserAction);

  CrashHandler handler(session, store, breadcrumbs, [] { return TestEnvironment(); }, previous);

  const auto error  = MakeWrappedError();
  const auto before = crumbtrail::util::NowMillis();
  handler.UncaughtException("worker-7", error);
  const auto after = crumbtrail::util::NowMillis();

  const auto files = store->ListCrashFiles();
  assert(files.size() == 1);
  assert(files[0].filename().string().find("-fatal-") != std::string::npos);

  auto crash = store->ReadCrash(files[0]);
  assert(crash.has_value());
  assert(crash->is_fatal());
  assert(crash->thread() == "worker-7");
  assert(crash->session_id() == "session-crash");
  assert(crash->timestamp() >= before && crash->timestamp() <= after);

  assert(crash->breadcrumbs_size() == 2);
  assert(crash->breadcrumbs(0).message() == "opened checkout");
  assert(crash->breadcrumbs(1).message() == "tapped pay");
  assert(crash->breadcrumbs(1).category() == "user_action");

  const auto& trace = crash->stacktrace();
  assert(trace.find("std::runtime_error") != std::string::npos);
  assert(trace.find("Wrapper exception") != std::string::npos);
  assert(trace.find("std::logic_error") != std::string::npos);
  assert(trace.find("Root cause") != std::string::npos);
  assert(trace.find("Wrapper exception") < trace.find("Root cause"));

  assert(crash->context().at("os_version") == "6.1.0");
  assert(crash->context().at("app_version") == "7");

  assert(previous->threads.size() == 1);
  assert(previous->threads[0] == "worker-7");
  assert(previous->errors[0] == error);
  assert(handler.state() == CrashHandler::State::kIdle);
}

void TestForwardsWhenStoreIsUnwritable() {
  const auto root = FreshRoot("unwritable");
  std::filesystem::create_directories(root.parent_path());
  {
    std::ofstream blocker(root);
    blocker << "not a directory";
  }

  auto store    = std::make_shared<EventStore>(root);
  auto previous = std::make_shared<RecordingHandler>();
  CrashHandler handler(std::make_shared<Session>(), store, std::make_shared<BreadcrumbBuffer>(), nullptr, previous);

  const auto error = std::make_exception_ptr(std::runtime_error("disk is gone"));
  handler.UncaughtException("main", error);

  assert(previous->threads.size() == 1);
  assert(previous->threads[0] == "main");
  assert(previous->errors[0] == error);

  std::filesystem::remove(root);
}

void TestForwardsWhenEnvironmentThrows() {
  auto store    = std::make_shared<EventStore>(FreshRoot("environment_throws"));
  auto previous = std::make_shared<RecordingHandler>();
  CrashHandler handler(
      std::make_shared<Session>(), store, std::make_shared<BreadcrumbBuffer>(),
      []() -> crumbtrail::v1::Environment { throw std::runtime_error("uname failed"); }, previous);

  handler.UncaughtException("main", std::make_exception_ptr(std::out_of_range("index 9")));

  assert(previous->errors.size() == 1);
  const auto files = store->ListCrashFiles();
  assert(files.size() == 1);
  auto crash = store->ReadCrash(files[0]);
  assert(crash.has_value());
  assert(crash->context().empty());
  assert(crash->stacktrace().find("std::out_of_range: index 9") != std::string::npos);
}

void TestReentrantFaultDoesNotRecurseIntoCapture() {
  auto store    = std::make_shared<EventStore>(FreshRoot("reentrant"));
  auto previous = std::make_shared<RecordingHandler>();

  std::shared_ptr<CrashHandler> handler;
  int                           provider_calls = 0;
  CrashHandler::State           after_nested   = CrashHandler::State::kIdle;
  auto provider = [&]() {
    ++provider_calls;
    // a second fault raised while the first one is being captured
    handler->UncaughtException("main", std::make_exception_ptr(std::runtime_error("fault during capture")));
    after_nested = handler->state();
    return TestEnvironment();
  };

  handler = std::make_shared<CrashHandler>(std::make_shared<Session>(), store, std::make_shared<BreadcrumbBuffer>(), provider, previous);
  handler->UncaughtException("main", std::make_exception_ptr(std::runtime_error("original fault")));

  assert(provider_calls == 1);
  assert(store->ListCrashFiles().size() == 1);
  assert(previous->errors.size() == 2);
  assert(after_nested == CrashHandler::State::kCapturing);
  assert(handler->state() == CrashHandler::State::kIdle);

  auto crash = store->ReadCrash(store->ListCrashFiles()[0]);
  assert(crash.has_value());
  assert(crash->stacktrace().find("original fault") != std::string::npos);
}

void TestStateIsDelegatingWhileForwarding() {
  auto store    = std::make_shared<EventStore>(FreshRoot("state"));
  auto previous = std::make_shared<RecordingHandler>();

  std::shared_ptr<CrashHandler> handler =
      std::make_shared<CrashHandler>(std::make_shared<Session>(), store, std::make_shared<BreadcrumbBuffer>(), nullptr, previous);

  CrashHandler::State seen = CrashHandler::State::kIdle;
  previous->observe        = [&] { seen = handler->state(); };

  handler->UncaughtException("main", std::make_exception_ptr(std::runtime_error("x")));
  assert(seen == CrashHandler::State::kDelegating);
  assert(handler->state() == CrashHandler::State::kIdle);
}

void TestDescribeNonStandardThrows() {
  const auto text = crumbtrail::crash::DescribeException(std::make_exception_ptr(std::string("plain string")));
  assert(text.find("plain string") != std::string::npos);

  const auto unknown = crumbtrail::crash::DescribeException(std::make_exception_ptr(42));
  assert(unknown.find("unknown exception type") != std::string::npos);
}

void TestTerminateHookRestoresPreviousHandler() {
  const auto original = std::get_terminate();

  auto previous = TerminateHook::PreviousDelegate();
  assert(previous != nullptr);

  auto handler = std::make_shared<RecordingHandler>();
  TerminateHook::Install(handler);
  assert(TerminateHook::Installed());
  assert(std::get_terminate() != original);

  TerminateHook::Uninstall();
  assert(!TerminateHook::Installed());
  assert(std::get_terminate() == original);
}

[[noreturn]] void ThrowUncaught() {
  throw std::runtime_error("fatal from child");
}

void TestUncaughtExceptionInProcessIsPersisted() {
  const auto root = FreshRoot("terminate_end_to_end");

  pid_t pid = ::fork();
  assert(pid >= 0);
  if (pid == 0) {
    auto store   = std::make_shared<EventStore>(root);
    auto crumbs  = std::make_shared<BreadcrumbBuffer>();
    auto handler = std::make_shared<CrashHandler>(std::make_shared<Session>("child-session"), store, crumbs, nullptr,
                                                  TerminateHook::PreviousDelegate());
    TerminateHook::Install(handler);
    crumbs->Add("about to fail", BreadcrumbCategory::kError);
    ThrowUncaught();
  }

  int status = 0;
  assert(::waitpid(pid, &status, 0) == pid);
  assert(WIFSIGNALED(status));
  assert(WTERMSIG(status) == SIGABRT);

  EventStore store(root);
  const auto files = store.ListCrashFiles();
  assert(files.size() == 1);
  auto crash = store.ReadCrash(files[0]);
  assert(crash.has_value());
  assert(crash->is_fatal());
  assert(crash->session_id() == "child-session");
  assert(!crash->thread().empty());
  assert(crash->stacktrace().find("fatal from child") != std::string::npos);
  assert(crash->breadcrumbs_size() == 1);
}

} // namespace

int main() {
  TestCaptureRecordsFatalCrashAndForwards();
  TestForwardsWhenStoreIsUnwritable();
  TestForwardsWhenEnvironmentThrows();
  TestReentrantFaultDoesNotRecurseIntoCapture();
  TestStateIsDelegatingWhileForwarding();
  TestDescribeNonStandardThrows();
  TestTerminateHookRestoresPreviousHandler();
  TestUncaughtExceptionInProcessIsPersisted();

  std::cout << "crumbtrail_unit_crash_handler: pass\n";
  return 0;
}
