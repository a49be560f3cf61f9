#include "process.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

// ─────────────────────────────────────
bool IsPortOpen(const std::string &host, int port, std::chrono::milliseconds timeout) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        return false;
    }

    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close(sock);
        return false;
    }

    int result = connect(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    if (result == 0) {
        close(sock);
        return true;
    }

    bool open = false;
    if (errno == EINPROGRESS) {
        fd_set writefds;
        FD_ZERO(&writefds);
        FD_SET(sock, &writefds);

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        if (select(sock + 1, nullptr, &writefds, nullptr, &tv) > 0) {
            int error = 0;
            socklen_t len = sizeof(error);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len);
            open = error == 0;
        }
    }
    close(sock);
    return open;
}

// ─────────────────────────────────────
bool HttpProbe(const std::string &host, int port, const std::string &path,
               std::chrono::seconds timeout) {
    httplib::Client client(host, port);
    client.set_connection_timeout(static_cast<time_t>(timeout.count()), 0);
    client.set_read_timeout(static_cast<time_t>(timeout.count()), 0);

    auto res = client.Get(path);
    if (!res) {
        spdlog::debug("HttpProbe: GET {}:{}{} failed: {}", host, port, path,
                      httplib::to_string(res.error()));
        return false;
    }
    return res->status == 200;
}

// ─────────────────────────────────────
std::vector<pid_t> FindProcessesByCmdline(const std::string &pattern) {
    std::vector<pid_t> pids;
    if (pattern.empty()) {
        return pids;
    }

    const pid_t self = getpid();
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        const pid_t pid = static_cast<pid_t>(std::stol(name));
        if (pid == self) {
            continue;
        }

        std::ifstream file(entry.path() / "cmdline", std::ios::binary);
        if (!file.is_open()) {
            continue;
        }
        std::string cmdline((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
        if (cmdline.find(pattern) != std::string::npos) {
            pids.push_back(pid);
        }
    }
    if (ec) {
        spdlog::warn("FindProcessesByCmdline: Cannot scan /proc: {}", ec.message());
    }
    return pids;
}

// ─────────────────────────────────────
ProcessService::ProcessService(ServiceSpec spec) : m_Spec(std::move(spec)) {}

// ─────────────────────────────────────
ProcessService::~ProcessService() {
    StopLaunched();
}

// ─────────────────────────────────────
bool ProcessService::ChildAlive() {
    if (m_Pid <= 0) {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(m_Pid, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == m_Pid) {
        if (WIFEXITED(status)) {
            spdlog::warn("{}: Process {} exited with status {}", m_Spec.name, m_Pid,
                         WEXITSTATUS(status));
        } else if (WIFSIGNALED(status)) {
            spdlog::warn("{}: Process {} killed by signal {}", m_Spec.name, m_Pid,
                         WTERMSIG(status));
        }
        m_Pid = -1;
        return false;
    }

    // Not our child any more (ECHILD); fall back to a signal probe.
    if (kill(m_Pid, 0) == 0) {
        return true;
    }
    m_Pid = -1;
    return false;
}

// ─────────────────────────────────────
bool ProcessService::ProbeAlive() const {
    if (m_Spec.port > 0) {
        if (!IsPortOpen(m_Spec.host, m_Spec.port)) {
            return false;
        }
        if (!m_Spec.health_path.empty()) {
            return HttpProbe(m_Spec.host, m_Spec.port, m_Spec.health_path);
        }
        return true;
    }
    if (!m_Spec.match_pattern.empty()) {
        return !FindProcessesByCmdline(m_Spec.match_pattern).empty();
    }
    return false;
}

// ─────────────────────────────────────
bool ProcessService::IsAlive() {
    if (!IsSupervised()) {
        return true;
    }
    if (ChildAlive()) {
        return true;
    }
    return ProbeAlive();
}

// ─────────────────────────────────────
bool ProcessService::Start(std::string &error) {
    if (!IsSupervised()) {
        return true;
    }
    if (ChildAlive()) {
        spdlog::debug("{}: Already running as pid {}", m_Spec.name, m_Pid);
        return true;
    }

    // Everything the child needs is built before fork.
    std::vector<char *> argv;
    argv.reserve(m_Spec.command.size() + 1);
    for (const auto &arg : m_Spec.command) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string logFile = m_Spec.log_file.empty() ? "/dev/null" : m_Spec.log_file;
    const std::string workDir = m_Spec.working_dir;

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        int fd = open(logFile.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd >= 0) {
            dup2(fd, STDOUT_FILENO);
            dup2(fd, STDERR_FILENO);
            close(fd);
        }
        int nullFd = open("/dev/null", O_RDONLY);
        if (nullFd >= 0) {
            dup2(nullFd, STDIN_FILENO);
            close(nullFd);
        }
        // The signal mask survives exec, the child starts with none blocked.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        setsid();
        if (!workDir.empty() && chdir(workDir.c_str()) != 0) {
            _exit(126);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    m_Pid = pid;
    spdlog::info("{}: Started pid {} ({})", m_Spec.name, pid, m_Spec.command.front());

    std::this_thread::sleep_for(m_Spec.startup_grace);
    if (!IsAlive()) {
        error = m_Spec.name + " did not come up";
        return false;
    }
    return true;
}

// ─────────────────────────────────────
void ProcessService::Stop() {
    if (!IsSupervised()) {
        return;
    }
    if (m_Pid > 0) {
        StopLaunched();
    }
    // Anything still matching was started by someone else and would hold the port.
    StopMatching();
}

// ─────────────────────────────────────
void ProcessService::StopMatching() {
    if (m_Spec.match_pattern.empty()) {
        return;
    }
    std::vector<pid_t> pids = FindProcessesByCmdline(m_Spec.match_pattern);
    if (pids.empty()) {
        return;
    }

    for (pid_t pid : pids) {
        spdlog::info("{}: Stopping unmanaged pid {}", m_Spec.name, pid);
        if (kill(pid, SIGTERM) != 0 && errno != ESRCH) {
            spdlog::warn("{}: SIGTERM to {} failed: {}", m_Spec.name, pid, std::strerror(errno));
        }
    }

    // Exited processes lose their cmdline even before they are reaped.
    const auto deadline = std::chrono::steady_clock::now() + m_Spec.stop_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        pids = FindProcessesByCmdline(m_Spec.match_pattern);
        if (pids.empty()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    for (pid_t pid : pids) {
        spdlog::warn("{}: Pid {} ignored SIGTERM, sending SIGKILL", m_Spec.name, pid);
        kill(pid, SIGKILL);
    }
}

// ─────────────────────────────────────
void ProcessService::StopLaunched() {
    if (m_Pid <= 0) {
        return;
    }

    const pid_t pid = m_Pid;
    m_Pid = -1;

    // The child leads its own session, so signal the whole group.
    if (kill(-pid, SIGTERM) != 0 && kill(pid, SIGTERM) != 0) {
        if (errno != ESRCH) {
            spdlog::warn("{}: SIGTERM to {} failed: {}", m_Spec.name, pid, std::strerror(errno));
        }
        waitpid(pid, nullptr, WNOHANG);
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + m_Spec.stop_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result > 0 || (result < 0 && errno == ECHILD)) {
            spdlog::info("{}: Stopped pid {}", m_Spec.name, pid);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::warn("{}: Pid {} ignored SIGTERM, sending SIGKILL", m_Spec.name, pid);
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}
