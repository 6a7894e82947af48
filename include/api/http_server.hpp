#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "api/api_handler.hpp"
#include "common/parallel_task_manager.hpp"

// Minimal HTTP/1.1 front end: one request per connection, JSON bodies,
// handled on a worker pool.
class HttpServer {
public:
    HttpServer(std::shared_ptr<ApiHandler> handler, const std::string& bindAddress, int port,
               size_t workers = 8);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start(std::string& error);
    void stop();
    bool isRunning() const { return running_; }

    // Bound port; differs from the configured one when that was 0
    int getPort() const { return port_; }

    // Parses the request line and headers (everything before the blank line)
    static bool parseRequestHead(const std::string& head, ApiRequest& request,
                                 size_t& contentLength, std::string& error);
    static std::string formatResponse(const ApiResponse& response);

private:
    void acceptLoop();
    void handleConnection(int fd);
    bool readRequest(int fd, ApiRequest& request, std::string& error);
    void writeAll(int fd, const std::string& data);

    std::shared_ptr<ApiHandler> handler_;
    std::string bindAddress_;
    int port_;
    size_t workerCount_;
    int listenFd_;
    std::atomic<bool> running_;
    std::thread acceptThread_;
    std::unique_ptr<ParallelTaskManager> workers_;
};
