#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_(config_.audio.ring_capacity_samples()),
      audio_capture_(ring_, config_.audio.capture_rate),
      audio_playback_(config_.audio.playback_rate),
      connector_(config_.backend, events_),
      core_(config_, verbose_, ring_, audio_capture_, audio_playback_, connector_, timers_) {
    // Both callbacks fire on PipeWire threads; they only wake the loop.
    audio_capture_.set_ready_callback([this] { notify_fd(capture_event_fd_); },
                                      config_.audio.chunk_samples);
    audio_playback_.set_finished_callback([this](uint64_t id) {
        events_.post([this, id] { core_.on_playback_finished(id); });
    });
    events_.set_notify([this] { notify_fd(task_event_fd_); });
}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (capture_event_fd_ >= 0) ::close(capture_event_fd_);
    if (task_event_fd_ >= 0) ::close(task_event_fd_);
}

bool LinuxEventLoop::init() {
    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Capture chunk notification and cross-thread task queue
    capture_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    task_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (capture_event_fd_ < 0 || task_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(capture_event_fd_, EPOLLIN) ||
        !add_fd(task_event_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timers_.next_timeout_ms());
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == capture_event_fd_) {
                uint64_t val;
                ::read(capture_event_fd_, &val, sizeof(val));
                core_.on_capture_ready();
                continue;
            }

            if (fd == task_event_fd_) {
                uint64_t val;
                ::read(task_event_fd_, &val, sizeof(val));
                events_.drain();
                continue;
            }

            handle_client(fd);
        }

        timers_.run_due();
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    // A client may pipeline several requests in one write.
    while (true) {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case IpcServer::ReadStatus::Complete: {
                std::string cmd_str = cmd.value("cmd", "");
                auto response = core_.handle_command(cmd_str, cmd);
                ipc_server_.send_response(fd, response);
                break;
            }
            case IpcServer::ReadStatus::Malformed:
                ipc_server_.send_response(fd, {{"status", "error"}, {"message", "malformed request"}});
                break;
            case IpcServer::ReadStatus::Incomplete:
                return;
            case IpcServer::ReadStatus::Disconnected:
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                ipc_server_.close_client(fd);
                return;
        }
    }
}

void LinuxEventLoop::notify_fd(int fd) {
    if (fd < 0) return;
    uint64_t val = 1;
    ::write(fd, &val, sizeof(val));
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[live-interpreter] {}", msg);
    }
}
