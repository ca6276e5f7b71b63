#pragma once

#include <string>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns the exit code, -1 if it did not
    // exit normally, 127 if the program could not be executed.
    int wait();

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string* input);
};

// Spawn a child process. If input is non-null it is written to the child's
// stdin, which is then closed; otherwise the child gets no stdin.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string* input = nullptr);

// Spawn and wait. Returns the exit code, or -1 if the process could not be
// started.
int run(const std::string& program, const std::vector<std::string>& args);
int run_with_input(const std::string& program,
                   const std::vector<std::string>& args,
                   const std::string& input);

} // namespace platform
