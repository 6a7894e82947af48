#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

struct CaptureRequest {
    std::string jobId;
    std::string vmIdentifier;
    std::string backupType;
    std::string nbdHost;
    std::string targetDescriptor;
    std::map<std::string, std::string> changeTrackingTokens;  // diskKey -> token, incrementals only
    std::string telemetryUrl;

    nlohmann::json toJson() const;
};

struct CaptureResponse {
    bool accepted{false};
    std::string jobId;
    std::string snapshotId;
    std::string message;
};

// The remote agent that snapshots the VM and streams every disk into the
// advertised NBD targets.
class CaptureAgent {
public:
    virtual ~CaptureAgent() = default;

    // Throws BackupError(CAPTURE_AGENT_UNREACHABLE or CAPTURE_AGENT_ERROR)
    virtual CaptureResponse startCapture(const CaptureRequest& request) = 0;
};

class HttpCaptureAgentClient : public CaptureAgent {
public:
    HttpCaptureAgentClient(const std::string& baseUrl, int timeoutSeconds = 30);

    CaptureResponse startCapture(const CaptureRequest& request) override;

private:
    // False only on transport failure; httpCode carries the HTTP status otherwise
    bool makeRequest(const std::string& method, const std::string& endpoint,
                     const nlohmann::json& data, std::string& responseBody,
                     long& httpCode, std::string& error);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

    std::string baseUrl_;
    int timeoutSeconds_;
};
