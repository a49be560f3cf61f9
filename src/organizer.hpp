#pragma once

#include <chrono>
#include <string>

struct OrganizeRequest {
    std::string target_path;
    std::string instruction;
    int resource_limit = 50;
};

struct OrganizeResult {
    bool ok = false;
    int files_affected = 0;
    std::string error;
};

// Boundary to whatever actually moves the files.
class OrganizeEngine {
  public:
    virtual ~OrganizeEngine() = default;
    virtual OrganizeResult Organize(const OrganizeRequest &request) = 0;
};

struct HttpOrganizerOptions {
    std::string url = "http://127.0.0.1:8000";
    std::string endpoint = "/chat";
    std::chrono::seconds connect_timeout = std::chrono::seconds(5);
    std::chrono::seconds read_timeout = std::chrono::seconds(600);
};

class HttpOrganizeEngine : public OrganizeEngine {
  public:
    explicit HttpOrganizeEngine(HttpOrganizerOptions options);

    OrganizeResult Organize(const OrganizeRequest &request) override;

  private:
    HttpOrganizerOptions m_Options;
};
