#pragma once

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

bool IsPortOpen(const std::string &host, int port,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(500));
bool HttpProbe(const std::string &host, int port, const std::string &path,
               std::chrono::seconds timeout = std::chrono::seconds(3));

// Pids whose /proc/<pid>/cmdline contains `pattern`, this process excluded.
std::vector<pid_t> FindProcessesByCmdline(const std::string &pattern);

struct ServiceSpec {
    std::string name;
    std::vector<std::string> command; // argv, empty means unsupervised
    std::string working_dir;
    std::string log_file; // child stdout and stderr, /dev/null when empty
    std::string host = "127.0.0.1";
    int port = 0;              // liveness by TCP connect when > 0
    std::string health_path;   // plus GET <path> == 200 when set
    std::string match_pattern; // liveness by command line when port is 0, strays on Stop
    std::chrono::milliseconds startup_grace = std::chrono::seconds(3);
    std::chrono::milliseconds stop_timeout = std::chrono::seconds(5);
};

class SupervisedService {
  public:
    virtual ~SupervisedService() = default;

    virtual const std::string &Name() const = 0;
    virtual bool IsSupervised() const = 0;
    virtual bool IsAlive() = 0;
    virtual bool Start(std::string &error) = 0;
    // Stops the service, including instances a previous supervisor left behind.
    virtual void Stop() = 0;
    // Stops only what this object launched.
    virtual void StopLaunched() {
        Stop();
    }
};

// A child process started with fork/exec in its own session.
class ProcessService : public SupervisedService {
  public:
    explicit ProcessService(ServiceSpec spec);
    ~ProcessService() override;

    const std::string &Name() const override {
        return m_Spec.name;
    }
    bool IsSupervised() const override {
        return !m_Spec.command.empty();
    }
    bool IsAlive() override;
    bool Start(std::string &error) override;
    void Stop() override;
    void StopLaunched() override;

    pid_t Pid() const {
        return m_Pid;
    }

  private:
    bool ChildAlive();
    bool ProbeAlive() const;
    void StopMatching();

    ServiceSpec m_Spec;
    pid_t m_Pid = -1;
};
