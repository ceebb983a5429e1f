#pragma once

#include <string>

namespace framecomp::bulk {

/*
  A reserved bulk run waiting for a run worker.
*/
struct RunTask {
  std::string run_id;
  std::string project_id;
};

} // namespace framecomp::bulk
