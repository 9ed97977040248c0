#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "event_queue.hpp"
#include "live/gemini_live.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/pipewire_playback.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "ring_buffer.hpp"
#include "timer_queue.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    static void notify_fd(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Loop-thread plumbing (constructed before anything that posts to it)
    TimerQueue timers_;
    EventQueue events_;

    // Platform implementations (constructed before core_)
    SampleRing ring_;
    PipeWireCapture audio_capture_;
    PipeWirePlayback audio_playback_;
    GeminiLiveConnector connector_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int capture_event_fd_ = -1;
    int task_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
