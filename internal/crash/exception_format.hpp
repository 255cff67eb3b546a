#pragma once

#include <exception>
#include <string>
#include <typeinfo>

namespace crumbtrail::crash {

// Demangled C++ type name, e.g. "std::runtime_error".
std::string DemangledTypeName(const std::type_info& type);

/*
  Renders an exception and every exception nested inside it
  (std::throw_with_nested), outermost first:

    std::runtime_error: Wrapper exception
    Caused by: std::logic_error: Root cause
*/
std::string DescribeException(std::exception_ptr error);

// Frames of the calling thread, one "\tat <symbol>" per line.
std::string CaptureBacktrace(int skip_frames = 1);

} // namespace crumbtrail::crash
