#include "api/http_server.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace {

const size_t kMaxHeaderBytes = 64 * 1024;
const size_t kMaxBodyBytes = 4 * 1024 * 1024;
const int kSocketTimeoutSeconds = 30;

std::string reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

HttpServer::HttpServer(std::shared_ptr<ApiHandler> handler, const std::string& bindAddress, int port,
                       size_t workers)
    : handler_(std::move(handler))
    , bindAddress_(bindAddress)
    , port_(port)
    , workerCount_(workers == 0 ? 1 : workers)
    , listenFd_(-1)
    , running_(false) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    if (running_) {
        error = "server already running";
        return false;
    }

    // Close-on-exec so spawned transfer servers never hold the API port
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("socket: ") + std::strerror(errno);
        return false;
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (inet_pton(AF_INET, bindAddress_.c_str(), &addr.sin_addr) != 1) {
        close(fd);
        error = "invalid bind address: " + bindAddress_;
        return false;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind " + bindAddress_ + ":" + std::to_string(port_) + ": " + std::strerror(errno);
        close(fd);
        return false;
    }
    if (listen(fd, 64) < 0) {
        error = std::string("listen: ") + std::strerror(errno);
        close(fd);
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    listenFd_ = fd;
    workers_ = std::make_unique<ParallelTaskManager>(workerCount_, "http");
    running_ = true;
    acceptThread_ = std::thread(&HttpServer::acceptLoop, this);
    Logger::info("API listening on " + bindAddress_ + ":" + std::to_string(port_));
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        close(listenFd_);
        listenFd_ = -1;
    }
    if (workers_) {
        workers_->shutdown();
        workers_.reset();
    }
    Logger::info("API server stopped");
}

void HttpServer::acceptLoop() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error(std::string("poll on API socket failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        int client = accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                Logger::warning(std::string("accept failed: ") + std::strerror(errno));
            }
            continue;
        }

        timeval timeout{};
        timeout.tv_sec = kSocketTimeoutSeconds;
        setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        workers_->addTask([this, client]() { handleConnection(client); });
    }
}

void HttpServer::handleConnection(int fd) {
    ApiRequest request;
    std::string error;
    ApiResponse response;
    if (readRequest(fd, request, error)) {
        response = handler_->handle(request);
    } else {
        response = ApiHandler::errorResponse(ErrorKind::INVALID_REQUEST, error);
        if (error == "request body too large") {
            response.status = 413;
        }
    }
    writeAll(fd, formatResponse(response));
    close(fd);
}

bool HttpServer::readRequest(int fd, ApiRequest& request, std::string& error) {
    std::string buffer;
    char chunk[4096];
    size_t headerEnd = std::string::npos;

    while (headerEnd == std::string::npos) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            error = "connection closed before request head";
            return false;
        }
        buffer.append(chunk, static_cast<size_t>(n));
        headerEnd = buffer.find("\r\n\r\n");
        if (headerEnd == std::string::npos && buffer.size() > kMaxHeaderBytes) {
            error = "request head too large";
            return false;
        }
    }

    size_t contentLength = 0;
    if (!parseRequestHead(buffer.substr(0, headerEnd), request, contentLength, error)) {
        return false;
    }
    if (contentLength > kMaxBodyBytes) {
        error = "request body too large";
        return false;
    }

    request.body = buffer.substr(headerEnd + 4);
    while (request.body.size() < contentLength) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            error = "connection closed before request body";
            return false;
        }
        request.body.append(chunk, static_cast<size_t>(n));
    }
    request.body.resize(contentLength);
    return true;
}

void HttpServer::writeAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            Logger::warning(std::string("failed to write API response: ") + std::strerror(errno));
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

bool HttpServer::parseRequestHead(const std::string& head, ApiRequest& request,
                                  size_t& contentLength, std::string& error) {
    std::istringstream stream(head);
    std::string line;
    if (!std::getline(stream, line)) {
        error = "empty request";
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::istringstream requestLine(line);
    std::string target;
    std::string version;
    if (!(requestLine >> request.method >> target >> version) || version.compare(0, 5, "HTTP/") != 0) {
        error = "malformed request line";
        return false;
    }

    size_t queryStart = target.find('?');
    request.path = target.substr(0, queryStart);
    request.query.clear();
    if (queryStart != std::string::npos) {
        for (const auto& pair : utils::split(target.substr(queryStart + 1), '&')) {
            if (pair.empty()) {
                continue;
            }
            size_t eq = pair.find('=');
            std::string key = utils::urlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : utils::urlDecode(pair.substr(eq + 1));
            request.query[key] = value;
        }
    }

    contentLength = 0;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = toLower(utils::trim(line.substr(0, colon)));
        std::string value = utils::trim(line.substr(colon + 1));
        if (name == "content-length") {
            try {
                contentLength = static_cast<size_t>(std::stoull(value));
            } catch (const std::exception&) {
                error = "invalid Content-Length: " + value;
                return false;
            }
        } else if (name == "transfer-encoding" && toLower(value) != "identity") {
            error = "unsupported Transfer-Encoding: " + value;
            return false;
        }
    }
    return true;
}

std::string HttpServer::formatResponse(const ApiResponse& response) {
    std::string body = response.body.is_null() ? "{}" : response.body.dump();
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << reasonPhrase(response.status) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return out.str();
}
