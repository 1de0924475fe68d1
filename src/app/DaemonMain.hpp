#pragma once

namespace tf::app
{

// Runs the TinyFetch daemon: loads the pipeline configuration named on the
// command line (or by $TF_CONFIG) and polls until SIGINT/SIGTERM or until
// --run-seconds elapses. Returns the process exit code.
int daemon_main(int argc, char *argv[]);

} // namespace tf::app
