#pragma once

/**
 * @file process.hpp
 * @brief fork/exec plumbing shared by the capture harness and the engine
 */

#include "hookline/environment.hpp"
#include "hookline/types.hpp"

#include <string>
#include <vector>

#include <sys/types.h>

namespace hookline {

class SignalRegistry;

namespace process {

// ============================================================================
// File Descriptors
// ============================================================================

// pipe() with both ends close-on-exec
Result<void> open_pipe(int fds[2]);

// Close and mark as -1; no-op for negative descriptors
void close_fd(int& fd);

// ============================================================================
// Spawning
// ============================================================================

/**
 * A descriptor the child sees at `child_fd`, backed by the parent's
 * `parent_fd`.
 */
struct Redirect {
    int child_fd;
    int parent_fd;
};

/**
 * Fork and execve argv[0] with the given environment.
 *
 * The child exits with 127 when it cannot be set up or exec fails.
 */
Result<pid_t> spawn(const std::vector<std::string>& argv,
                    const Environment& env,
                    const std::vector<Redirect>& redirects = {});

/**
 * Wait for a child to finish and return its exit code.
 *
 * `done_fd` (optional, -1 when unused) becomes readable once the caller's
 * stream readers reached end of file. While waiting, signals the registry
 * has marked pending are forwarded to the child once each.
 */
Result<int> wait(pid_t pid, int done_fd, SignalRegistry* signals);

// WEXITSTATUS, or 128 + WTERMSIG for a signalled child
int decode_status(int status);

// ============================================================================
// Attached Execution
// ============================================================================

struct AttachedResult {
    int exit_code = 0;
    std::string report;  // bytes the child wrote to the report descriptor
};

/**
 * Run a child that shares the coordinator's stdout/stderr.
 *
 * When report_fd >= 0 the child gets a pipe at that descriptor; everything
 * written to it is returned in AttachedResult::report.
 */
Result<AttachedResult> run_attached(const std::vector<std::string>& argv,
                                    const Environment& env,
                                    SignalRegistry* signals,
                                    int report_fd = -1);

/**
 * Locate an executable: names containing '/' are returned unchanged,
 * others are searched in the PATH of `env`. Returns the name itself when
 * nothing matches so that exec reports the failure.
 */
std::string resolve_executable(const std::string& name, const Environment& env);

} // namespace process
} // namespace hookline
