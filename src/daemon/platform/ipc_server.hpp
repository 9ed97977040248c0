#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Newline-delimited JSON command channel. One request, one response per line.
class IpcServer {
public:
    enum class ReadStatus {
        Complete,     // cmd holds the next command
        Incomplete,   // no full line buffered yet
        Malformed,    // a full line arrived but was not a JSON object
        Disconnected,
    };

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
