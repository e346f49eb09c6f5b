#ifndef COMMAND_SERVER_HPP
#define COMMAND_SERVER_HPP

#include <functional>
#include <string>
#include <thread>
#include <atomic>
#include <cstdint>
#include <mutex>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

// Loopback UDP endpoint for the hotkey front-end. Every datagram is one command
// line; the sender of the latest datagram becomes the active client and
// receives the notifications.
class CommandServer {
public:
    using CallBack = std::function<void(const std::string& msg,
                                        const std::string& senderIp,
                                        uint16_t senderPort)>;

    CommandServer(std::string bind_ip, int port, CallBack callback_function);
    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    // Binds the socket and starts the receive thread. Throws std::runtime_error
    // when the address cannot be bound.
    void start();
    void stop();

    // Actual port (useful when constructed with port 0).
    uint16_t boundPort() const { return bound_port_; }

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

private:
    void run();

    void setActiveClient(const std::string& ip, uint16_t port);

    std::string bind_ip_;
    int port_;
    uint16_t bound_port_{0};
    CallBack callback_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<socket_t> sock_{kInvalidSocket};

    std::mutex client_mutex_;
    std::string active_ip_{"127.0.0.1"};
    uint16_t active_port_{0};
    bool has_active_client_{false};
};

#endif
