#include "live/gemini_live.hpp"

#include "live/live_protocol.hpp"

#include <cerrno>
#include <cstring>
#include <curl/curl.h>
#include <format>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <unistd.h>

namespace {

// Lets close() abort a connect or TLS handshake that is still in progress.
int abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

// Waits for the socket to drain, or for close() to signal the wake fd.
void wait_writable(curl_socket_t sock, int wake_fd) {
    pollfd fds[2] = {
        {.fd = sock, .events = POLLOUT, .revents = 0},
        {.fd = wake_fd, .events = POLLIN, .revents = 0},
    };
    ::poll(fds, 2, 200);
}

enum class RecvStatus { Drained, PeerClosed, Error };

} // namespace

GeminiLiveSession::GeminiLiveSession(uint64_t id, std::string url, std::string setup_message,
                                     EventQueue& events, LiveConnector::EventSink sink)
    : id_(id), url_(std::move(url)), setup_message_(std::move(setup_message)),
      events_(events), sink_(std::move(sink)) {}

GeminiLiveSession::~GeminiLiveSession() {
    close();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool GeminiLiveSession::launch() {
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "live: eventfd failed: {}", std::strerror(errno));
        return false;
    }
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
    return true;
}

void GeminiLiveSession::send_audio(const TransportFrame& frame) {
    if (closing_.load(std::memory_order_relaxed)) return;
    if (!outbox_.push(live::protocol::build_audio(frame))) {
        auto dropped = outbox_.dropped();
        // Log the first drop and then every 64th.
        if (dropped % 64 == 1) {
            std::println(stderr, "live: handle {}: send stalled, {} frame(s) dropped",
                         id_, dropped);
        }
        return;
    }
    wake();
}

void GeminiLiveSession::close() {
    if (closing_.exchange(true)) return;
    worker_.request_stop();
    wake();
}

void GeminiLiveSession::wake() {
    if (wake_fd_ < 0) return;
    uint64_t val = 1;
    ::write(wake_fd_, &val, sizeof(val));
}

void GeminiLiveSession::drain_wake() {
    uint64_t val;
    while (::read(wake_fd_, &val, sizeof(val)) > 0) {
    }
}

void GeminiLiveSession::post(live::Event event) {
    events_.post([sink = sink_, id = id_, event = std::move(event)]() mutable {
        sink(id, std::move(event));
    });
}

void GeminiLiveSession::run(std::stop_token stop) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        post(live::Failed{"curl_easy_init failed"});
        post(live::Closed{"init failed"});
        return;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L); // websocket upgrade, then hand over
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_on_stop);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        if (!stop.stop_requested()) {
            post(live::Failed{std::string("connect failed: ") + curl_easy_strerror(rc)});
        }
        curl_easy_cleanup(curl);
        post(live::Closed{"connect failed"});
        return;
    }

    curl_socket_t sock = CURL_SOCKET_BAD;
    curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sock);

    auto send_text = [&](const std::string& msg) {
        return live::send_fully(
            msg, stop,
            [&](const char* data, size_t len, size_t* sent) {
                return curl_ws_send(curl, data, len, sent, 0, CURLWS_TEXT);
            },
            [&] {
                wait_writable(sock, wake_fd_);
                drain_wake();
            });
    };

    rc = send_text(setup_message_);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        curl_easy_cleanup(curl);
        post(live::Closed{"closed by client"});
        return;
    }
    if (rc != CURLE_OK) {
        post(live::Failed{std::string("setup send failed: ") + curl_easy_strerror(rc)});
        curl_easy_cleanup(curl);
        post(live::Closed{"setup failed"});
        return;
    }

    bool opened = false;
    std::string message;
    std::string reason;

    auto dispatch = [&](const std::string& text) {
        auto parsed = live::protocol::parse_server_message(text);
        if (!parsed) {
            std::println(stderr, "live: handle {}: ignoring message: {}", id_, parsed.error());
            return;
        }
        if (parsed->setup_complete && !opened) {
            opened = true;
            post(live::Opened{});
        }
        for (auto& ev : parsed->events) {
            post(std::move(ev));
        }
    };

    auto receive = [&]() -> RecvStatus {
        char buf[16384];
        while (true) {
            size_t nread = 0;
            const curl_ws_frame* meta = nullptr;
            CURLcode r = curl_ws_recv(curl, buf, sizeof(buf), &nread, &meta);
            if (r == CURLE_AGAIN) return RecvStatus::Drained;
            if (r == CURLE_GOT_NOTHING) {
                reason = "connection closed by server";
                return RecvStatus::PeerClosed;
            }
            if (r != CURLE_OK) {
                reason = std::string("receive failed: ") + curl_easy_strerror(r);
                return RecvStatus::Error;
            }
            if (meta->flags & CURLWS_CLOSE) {
                reason = "server sent close frame";
                if (nread > 2) reason += ": " + std::string(buf + 2, nread - 2);
                return RecvStatus::PeerClosed;
            }
            if (meta->flags & (CURLWS_TEXT | CURLWS_BINARY)) {
                message.append(buf, nread);
                if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                    dispatch(message);
                    message.clear();
                }
            }
        }
    };

    while (!stop.stop_requested()) {
        pollfd fds[2] = {
            {.fd = sock, .events = POLLIN, .revents = 0},
            {.fd = wake_fd_, .events = POLLIN, .revents = 0},
        };
        int n = ::poll(fds, 2, 200);
        if (n < 0 && errno != EINTR) {
            reason = std::string("poll failed: ") + std::strerror(errno);
            post(live::Failed{reason});
            break;
        }
        if (stop.stop_requested()) break;

        if (fds[1].revents & POLLIN) drain_wake();

        // Checked every pass: a blocked send may have swallowed the wakeup.
        bool send_failed = false;
        for (auto& msg : outbox_.take()) {
            rc = send_text(msg);
            if (rc == CURLE_ABORTED_BY_CALLBACK) break;
            if (rc != CURLE_OK) {
                reason = std::string("send failed: ") + curl_easy_strerror(rc);
                post(live::Failed{reason});
                send_failed = true;
                break;
            }
        }
        if (send_failed || stop.stop_requested()) break;

        // libcurl may hold buffered frames that poll() can't see.
        auto status = receive();
        if (status == RecvStatus::Error) {
            post(live::Failed{reason});
            break;
        }
        if (status == RecvStatus::PeerClosed) break;
    }

    if (stop.stop_requested()) {
        size_t sent = 0;
        curl_ws_send(curl, "", 0, &sent, 0, CURLWS_CLOSE);
        reason = "closed by client";
    }

    curl_easy_cleanup(curl);
    post(live::Closed{reason});
}

GeminiLiveConnector::GeminiLiveConnector(Config::Backend config, EventQueue& events)
    : config_(std::move(config)), events_(events) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GeminiLiveConnector::~GeminiLiveConnector() {
    curl_global_cleanup();
}

std::expected<std::unique_ptr<LiveSession>, std::string>
GeminiLiveConnector::open(const live::SessionRequest& request, EventSink sink) {
    auto key = config_.resolve_api_key();
    if (key.empty()) {
        return std::unexpected(std::format("no API key (set backend.api_key or ${})",
                                           config_.api_key_env));
    }

    auto url = std::format("{}?key={}", config_.url, key);
    auto setup = live::protocol::build_setup(request, config_.voice);

    auto session = std::make_unique<GeminiLiveSession>(next_id_++, std::move(url),
                                                       std::move(setup), events_, std::move(sink));
    if (!session->launch()) {
        return std::unexpected("failed to start session worker");
    }
    return std::unique_ptr<LiveSession>(std::move(session));
}
