#include "plonkish/utils/profiling.h"

#include <sstream>
#include <utility>

#include "glog/logging.h"

#include "plonkish/error_handling/error_handling.h"

namespace plonkish {

namespace {

// Command line argument -v should be at least 1 to enable profiling.
constexpr int kVlog = 1;

auto program_start = std::chrono::system_clock::now();

template <typename Duration>
void PrintDuration(std::ostream* os, Duration d) {
  std::chrono::duration<double> sec = d;
  *os << sec.count() << " sec";
}

/*
  Prints the time since program start, unless glog already prefixes every line with a timestamp.
*/
void PrintElapsedSinceStart(std::ostream* os) {
  if (FLAGS_log_prefix) {
    return;
  }
  PrintDuration(os, std::chrono::system_clock::now() - program_start);
  *os << ": ";
}

}  // namespace

ProfilingBlock::ProfilingBlock(std::string description)
    : start_time_(std::chrono::system_clock::now()), description_(std::move(description)) {
  if (FLAGS_v < kVlog) {
    return;
  }
  std::stringstream os;
  PrintElapsedSinceStart(&os);
  os << description_ << " started";
  VLOG(kVlog) << os.str();
}

ProfilingBlock::~ProfilingBlock() {
  if (!closed_) {
    CloseBlock();
  }
}

void ProfilingBlock::CloseBlock() {
  if (FLAGS_v < kVlog) {
    return;
  }
  ASSERT_RELEASE(!closed_, "ProfilingBlock.CloseBlock() called twice.");

  std::stringstream os;
  PrintElapsedSinceStart(&os);
  os << description_ << " finished in ";
  PrintDuration(&os, std::chrono::system_clock::now() - start_time_);
  VLOG(kVlog) << os.str();
  closed_ = true;
}

}  // namespace plonkish
