#include "backup/capture_agent_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>

using json = nlohmann::json;

json CaptureRequest::toJson() const {
    json doc = {
        {"job_id", jobId},
        {"vm_identifier", vmIdentifier},
        {"vm_name", vmIdentifier},
        {"backup_type", backupType},
        {"nbd_host", nbdHost},
        {"nbd_targets", targetDescriptor}
    };
    if (!changeTrackingTokens.empty()) {
        doc["change_tracking_tokens"] = changeTrackingTokens;
    }
    if (!telemetryUrl.empty()) {
        doc["telemetry_url"] = telemetryUrl;
    }
    return doc;
}

HttpCaptureAgentClient::HttpCaptureAgentClient(const std::string& baseUrl, int timeoutSeconds)
    : baseUrl_(baseUrl)
    , timeoutSeconds_(timeoutSeconds) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

CaptureResponse HttpCaptureAgentClient::startCapture(const CaptureRequest& request) {
    std::string body;
    long httpCode = 0;
    std::string error;

    Logger::info("Requesting capture of " + request.vmIdentifier + " for job " + request.jobId +
                 " targets " + request.targetDescriptor);

    if (!makeRequest("POST", "/api/v1/backup/start", request.toJson(), body, httpCode, error)) {
        Logger::error("Capture agent unreachable at " + baseUrl_ + ": " + error);
        throw BackupError(ErrorKind::CAPTURE_AGENT_UNREACHABLE,
                          "capture agent unreachable: " + error, request.jobId);
    }

    CaptureResponse response;
    json doc;
    if (!body.empty()) {
        doc = json::parse(body, nullptr, false);
        if (doc.is_discarded()) {
            doc = json::object();
        }
    }

    if (httpCode < 200 || httpCode >= 300) {
        std::string detail = doc.is_object() ? doc.value("error", doc.value("message", body)) : body;
        Logger::error("Capture agent rejected job " + request.jobId + " with HTTP " +
                      std::to_string(httpCode) + ": " + detail);
        throw BackupError(ErrorKind::CAPTURE_AGENT_ERROR,
                          "capture agent returned HTTP " + std::to_string(httpCode) + ": " + detail,
                          request.jobId);
    }

    if (doc.is_object()) {
        response.accepted = doc.value("accepted", true);
        response.jobId = doc.value("job_id", request.jobId);
        response.snapshotId = doc.value("snapshot_id", "");
        response.message = doc.value("message", "");
    } else {
        response.accepted = true;
        response.jobId = request.jobId;
    }

    if (!response.accepted) {
        throw BackupError(ErrorKind::CAPTURE_AGENT_ERROR,
                          "capture agent declined job: " + response.message, request.jobId);
    }

    Logger::info("Capture agent accepted job " + request.jobId +
                 (response.snapshotId.empty() ? std::string() : " snapshot " + response.snapshotId));
    return response;
}

bool HttpCaptureAgentClient::makeRequest(const std::string& method, const std::string& endpoint,
                                         const json& data, std::string& responseBody,
                                         long& httpCode, std::string& error) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "failed to initialize CURL";
        return false;
    }

    std::string url = baseUrl_ + endpoint;
    Logger::debug("Making " + method + " request to: " + url);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);

    std::string payload;
    if (method == "POST" || method == "PUT") {
        payload = data.dump();
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    } else if (method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    CURLcode res = curl_easy_perform(curl);
    httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        error = curl_easy_strerror(res);
        return false;
    }
    Logger::debug("Response code " + std::to_string(httpCode) + " from " + url);
    return true;
}

size_t HttpCaptureAgentClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}
