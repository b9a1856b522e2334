#include "plonkish/error_handling/error_handling.h"

#include <sstream>
#include <string>
#include <utility>

#define BACKWARD_HAS_DW 1  // Enable usage of libdw from the elfutils for stack trace annotation.
#include "backward.hpp"

namespace plonkish {

namespace {

/*
  Frames of StackTraceOfCaller() and ThrowPlonkishException() themselves.
*/
constexpr size_t kSkippedFrames = 2;
constexpr size_t kMaxStackDepth = 64;

/*
  Returns the stack trace starting at the code that raised the exception.
*/
std::string StackTraceOfCaller() {
  backward::StackTrace trace;
  trace.load_here(kMaxStackDepth + kSkippedFrames);
  trace.skip_n_firsts(kSkippedFrames);
  std::ostringstream out;
  backward::Printer().print(trace, out);
  return out.str();
}

}  // namespace

void ThrowPlonkishException(
    const std::string& message, const char* file, size_t line_num) noexcept(false) {
  std::string exception_str = std::string(file) + ":" + std::to_string(line_num) + ": " + message;
  const size_t message_len = exception_str.size();
  exception_str += "\n" + StackTraceOfCaller();
  throw PlonkishException(std::move(exception_str), message_len);
}

}  // namespace plonkish
