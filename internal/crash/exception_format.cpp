#include "exception_format.hpp"

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string_view>

namespace crumbtrail::crash {

namespace {

constexpr int kMaxCauseDepth = 32;
constexpr int kMaxFrames     = 64;

// std::throw_with_nested wraps the thrown type; report the type the caller threw.
std::string ThrownTypeName(const std::exception& e) {
  static constexpr std::string_view kWrapper = "std::_Nested_exception<";

  auto name = DemangledTypeName(typeid(e));
  if (name.size() > kWrapper.size() && name.compare(0, kWrapper.size(), kWrapper) == 0 && name.back() == '>') {
    return name.substr(kWrapper.size(), name.size() - kWrapper.size() - 1);
  }
  return name;
}

void AppendException(std::ostringstream& out, const std::exception_ptr& error, int depth) {
  if (!error) {
    out << "no active exception\n";
    return;
  }
  if (depth > 0) {
    out << "Caused by: ";
  }

  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    out << ThrownTypeName(e) << ": " << e.what() << '\n';
    if (depth + 1 >= kMaxCauseDepth) {
      return;
    }
    try {
      std::rethrow_if_nested(e);
    } catch (...) {
      AppendException(out, std::current_exception(), depth + 1);
    }
  } catch (const std::nested_exception& nested) {
    out << "non-standard exception\n";
    if (depth + 1 < kMaxCauseDepth && nested.nested_ptr()) {
      AppendException(out, nested.nested_ptr(), depth + 1);
    }
  } catch (const char* message) {
    out << "const char*: " << message << '\n';
  } catch (const std::string& message) {
    out << "std::string: " << message << '\n';
  } catch (...) {
    out << "unknown exception type\n";
  }
}

} // namespace

std::string DemangledTypeName(const std::type_info& type) {
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), &std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
  return type.name();
}

std::string DescribeException(std::exception_ptr error) {
  std::ostringstream out;
  AppendException(out, error, 0);
  return out.str();
}

std::string CaptureBacktrace(int skip_frames) {
  void* frames[kMaxFrames];
  int   count = ::backtrace(frames, kMaxFrames);

  std::unique_ptr<char*, decltype(&std::free)> symbols(::backtrace_symbols(frames, count), &std::free);
  if (!symbols) {
    return {};
  }

  std::ostringstream out;
  for (int i = skip_frames; i < count; ++i) {
    out << "\tat " << symbols.get()[i] << '\n';
  }
  return out.str();
}

} // namespace crumbtrail::crash
