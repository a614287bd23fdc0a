#include "office_launcher.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace OfficePdf {
namespace Office {
namespace Launcher {

using namespace OfficePdf::Core;

OfficeLauncher::~OfficeLauncher() {
    terminate();
}

std::vector<std::string> OfficeLauncher::get_search_paths() {
#ifdef __APPLE__
    return {"/Applications/LibreOffice.app/Contents/MacOS/soffice",
            "/opt/homebrew/bin/soffice",
            "/usr/local/bin/soffice"};
#elif defined(_WIN32)
    return {"C:\\Program Files\\LibreOffice\\program\\soffice.exe",
            "C:\\Program Files (x86)\\LibreOffice\\program\\soffice.exe"};
#else
    return {"/usr/bin/soffice",
            "/usr/lib/libreoffice/program/soffice",
            "/usr/lib64/libreoffice/program/soffice",
            "/opt/libreoffice/program/soffice",
            "/usr/local/bin/soffice",
            "/snap/bin/libreoffice",
            "soffice",
            "libreoffice"};
#endif
}

std::string OfficeLauncher::find_on_path(const std::string& name) {
    const char* env = std::getenv("PATH");
    if (env == nullptr)
        return "";

    std::stringstream ss(env);
    std::string       dir;
#ifdef _WIN32
    const char separator = ';';
#else
    const char separator = ':';
#endif
    while (std::getline(ss, dir, separator)) {
        if (dir.empty())
            continue;
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code       ec;
        if (std::filesystem::is_regular_file(candidate, ec))
            return candidate.string();
    }
    return "";
}

std::string OfficeLauncher::find_office() {
    for (const auto& path : get_search_paths()) {
        if (std::filesystem::path(path).is_absolute()) {
            std::error_code ec;
            if (std::filesystem::exists(path, ec))
                return path;
        }
        else {
            std::string found = find_on_path(path);
            if (!found.empty())
                return found;
        }
    }
    return "";
}

bool OfficeLauncher::is_executable(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return false;
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

std::string OfficeLauncher::resolve_office(const std::string& configured) {
    if (configured.empty())
        return find_office();

    std::error_code ec;
    if (!std::filesystem::is_directory(configured, ec))
        return configured;

#ifdef _WIN32
    return (std::filesystem::path(configured) / "soffice.exe").string();
#else
    return (std::filesystem::path(configured) / "soffice").string();
#endif
}

std::string OfficeLauncher::program_dir(const std::string& configured) {
    std::error_code ec;
    if (!configured.empty() && std::filesystem::is_directory(configured, ec))
        return configured;

    std::string office = configured.empty() ? find_office() : configured;
    if (office.empty())
        return "";

    // /usr/bin/soffice is usually a link into the program directory.
    std::filesystem::path real = std::filesystem::canonical(office, ec);
    if (ec)
        return std::filesystem::path(office).parent_path().string();
    return real.parent_path().string();
}

int OfficeLauncher::run(const std::string& path, const std::vector<std::string>& args) {
    if (running()) {
        Logger::error("Office process already running");
        return NOT_STARTED;
    }

    if (!is_executable(path)) {
        Logger::error("Office path is not an executable file: " + path);
        return NOT_STARTED;
    }

    std::vector<std::string> arg_strings = {path};
    arg_strings.insert(arg_strings.end(), args.begin(), args.end());
    Logger::debug("Running: " + Utils::Text::join(arg_strings, " "));

#ifdef _WIN32
    std::string command_line;
    for (const auto& arg : arg_strings) {
        if (!command_line.empty())
            command_line += " ";
        command_line += "\"" + arg + "\"";
    }

    STARTUPINFOA        si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    ZeroMemory(&pi, sizeof(pi));

    if (!CreateProcessA(NULL,
                        const_cast<char*>(command_line.c_str()),
                        NULL,
                        NULL,
                        FALSE,
                        CREATE_NO_WINDOW,
                        NULL,
                        NULL,
                        &si,
                        &pi)) {
        Logger::error("Failed to launch office: " + std::to_string(GetLastError()));
        return NOT_STARTED;
    }
    CloseHandle(pi.hThread);
    process_handle_ = pi.hProcess;

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exit_code = 0;
    bool  exited    = GetExitCodeProcess(pi.hProcess, &exit_code);
    CloseHandle(pi.hProcess);
    process_handle_ = nullptr;
    return exited ? static_cast<int>(exit_code) : ABNORMAL_EXIT;
#else
    std::vector<const char*> argv;
    for (const auto& s : arg_strings)
        argv.push_back(s.c_str());
    argv.push_back(nullptr);

    // The child writes errno here when execv fails; a successful exec closes
    // the write end unread.
    int exec_pipe[2];
    if (pipe(exec_pipe) != 0) {
        Logger::error("Failed to create office exec pipe");
        return NOT_STARTED;
    }
    fcntl(exec_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        Logger::error("Failed to fork office process");
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return NOT_STARTED;
    }

    if (pid == 0) {
        ::close(exec_pipe[0]);

        // Only file descriptors are touched here: stdio buffers inherited from
        // the caller must not be flushed a second time.
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO)
                ::close(devnull);
        }

        execv(path.c_str(), const_cast<char* const*>(argv.data()));
        int     error   = errno;
        ssize_t written = write(exec_pipe[1], &error, sizeof(error));
        (void)written;
        _exit(127);
    }

    ::close(exec_pipe[1]);
    child_pid_ = pid;
    Logger::debug("Office process started (PID: " + std::to_string(pid) + ")");

    int     exec_error = 0;
    ssize_t got;
    do {
        got = read(exec_pipe[0], &exec_error, sizeof(exec_error));
    } while (got < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    int   status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    child_pid_ = -1;

    if (got == static_cast<ssize_t>(sizeof(exec_error))) {
        Logger::error("Cannot execute " + path + ": " + std::strerror(exec_error));
        return NOT_STARTED;
    }
    if (waited < 0) {
        Logger::error("Lost track of office process (PID: " + std::to_string(pid) + ")");
        return ABNORMAL_EXIT;
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);

    if (WIFSIGNALED(status))
        Logger::warn("Office process killed by signal " + std::to_string(WTERMSIG(status)));
    return ABNORMAL_EXIT;
#endif
}

void OfficeLauncher::terminate() {
#ifdef _WIN32
    if (process_handle_ != nullptr) {
        Logger::info("Closing office process...");
        TerminateProcess(process_handle_, 0);
        CloseHandle(process_handle_);
        process_handle_ = nullptr;
    }
#else
    if (child_pid_ > 0) {
        Logger::info("Closing office process (PID: " + std::to_string(child_pid_) + ")...");
        kill(child_pid_, SIGTERM);
        waitpid(child_pid_, nullptr, 0);
        child_pid_ = -1;
    }
#endif
}

bool OfficeLauncher::running() const {
#ifdef _WIN32
    return process_handle_ != nullptr;
#else
    return child_pid_ > 0;
#endif
}

}  // namespace Launcher
}  // namespace Office
}  // namespace OfficePdf
