#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace soundscribe::audio {

struct ProcessResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string stdout_data;
  std::string stderr_data;
};

/*
  Runs argv[0] (PATH lookup) as a child process with stdin on /dev/null
  and stdout/stderr captured through pipes. The child is SIGKILLed when
  it outlives the timeout. At most max_capture_bytes of each stream are
  kept, favoring the tail.

  Exit code is the child's status, 128+N for signal N, or 127 when the
  binary cannot be executed. Throws std::system_error if the pipes or
  the fork cannot be created.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         std::size_t max_capture_bytes = 64 * 1024);

} // namespace soundscribe::audio
