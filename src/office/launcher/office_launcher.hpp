#pragma once
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/types.h>
#endif

namespace OfficePdf {
namespace Office {
namespace Launcher {

// Starts the word processor's executable as a child process and waits for it.
class OfficeLauncher {
public:
    OfficeLauncher() = default;
    ~OfficeLauncher();

    OfficeLauncher(const OfficeLauncher&)            = delete;
    OfficeLauncher& operator=(const OfficeLauncher&) = delete;

    static constexpr int NOT_STARTED   = -1;
    static constexpr int ABNORMAL_EXIT = -2;

    static std::string find_office();
    static bool        is_executable(const std::string& path);

    // The binary named by a configured office path, which may also be the
    // LibreOffice program directory. Empty input auto-detects.
    static std::string resolve_office(const std::string& configured);
    // The program directory holding the binary, as LibreOfficeKit wants it.
    static std::string program_dir(const std::string& configured);

    // Exit status of the child. NOT_STARTED when it could not be executed,
    // ABNORMAL_EXIT when it was killed or lost.
    int  run(const std::string& path, const std::vector<std::string>& args);
    void terminate();
    bool running() const;

private:
    static std::vector<std::string> get_search_paths();
    static std::string              find_on_path(const std::string& name);

#ifdef _WIN32
    void* process_handle_ = nullptr;
#else
    pid_t child_pid_ = -1;
#endif
};

}  // namespace Launcher
}  // namespace Office
}  // namespace OfficePdf
