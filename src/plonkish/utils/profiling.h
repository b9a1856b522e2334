#ifndef PLONKISH_UTILS_PROFILING_H_
#define PLONKISH_UTILS_PROFILING_H_

#include <chrono>
#include <string>

namespace plonkish {

/*
  Annotates a stage of circuit construction and logs its duration.

  In order to see the logs, pass the cmd line args: -v=1 --logtostderr.

  Scoped usage:
  {
    ProfilingBlock profiling_block("synthesize circuit");
    ...
  }

  Or, when a scope is inconvenient:
  ProfilingBlock profiling_block("synthesize circuit");
  ...
  profiling_block.CloseBlock();
*/
class ProfilingBlock {
 public:
  explicit ProfilingBlock(std::string description);

  ~ProfilingBlock();

  /*
    Closes the block before it goes out of scope.
  */
  void CloseBlock();

  ProfilingBlock(const ProfilingBlock&) = delete;
  ProfilingBlock& operator=(const ProfilingBlock&) = delete;
  ProfilingBlock(ProfilingBlock&& other) = delete;
  ProfilingBlock& operator=(ProfilingBlock&& other) = delete;

 private:
  std::chrono::time_point<std::chrono::system_clock> start_time_;
  const std::string description_;
  bool closed_ = false;
};

}  // namespace plonkish

#endif  // PLONKISH_UTILS_PROFILING_H_
