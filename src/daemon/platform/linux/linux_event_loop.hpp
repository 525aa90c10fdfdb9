#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <string>

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
    void sync_mic_pump();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    std::string listen_url_;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int session_event_fd_ = -1;
    int sweep_timer_fd_ = -1;
    int mic_timer_fd_ = -1;
    bool mic_pump_armed_ = false;

    std::atomic<bool> running_{false};
};
