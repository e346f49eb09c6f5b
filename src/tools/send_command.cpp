#include "control/command.hpp"

#include <iostream>
#include <string>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
  static void closesock(socket_t s) { ::closesocket(s); }
#else
  #include <arpa/inet.h>
  #include <netinet/in.h>
  #include <sys/socket.h>
  #include <sys/time.h>
  #include <unistd.h>
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
  static void closesock(socket_t s) { ::close(s); }
#endif

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <COMMAND> [argument] [--wait] [--timeout <s>] [--host <ip>] [--port <n>]\n";
}

static void setRecvTimeout(socket_t s, int seconds) {
#ifdef _WIN32
    DWORD ms = (DWORD)seconds * 1000;
    ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, (const char*)&ms, sizeof(ms));
#else
    timeval tv{};
    tv.tv_sec = seconds;
    ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

// Sends one command line to the daemon and optionally prints its next notification.
int main(int argc, char** argv) {
    std::string line;
    std::string host = "127.0.0.1";
    int port = 34909;
    bool wait = false;
    int timeoutSec = 600;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--wait") {
            wait = true;
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::stoi(argv[++i]);
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeoutSec = std::stoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            line += line.empty() ? arg : " " + arg;
        }
    }

    Command cmd;
    if (!parseCommand(line, cmd)) {
        std::cerr << "Unknown command: '" << line << "'\n";
        printUsage(argv[0]);
        return 2;
    }

#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) {
        std::cerr << "WSAStartup failed\n";
        return 1;
    }
#endif

    socket_t s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s == kInvalidSocket) {
        std::cerr << "socket() failed\n";
        return 1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        std::cerr << "invalid host: " << host << "\n";
        closesock(s);
        return 1;
    }

    const int sent = (int)::sendto(s, line.data(), (int)line.size(), 0,
                                   reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent != (int)line.size()) {
        std::cerr << "sendto() failed\n";
        closesock(s);
        return 1;
    }

    int rc = 0;
    if (wait) {
        setRecvTimeout(s, timeoutSec);
        char buff[2048];
        const int n = (int)::recv(s, buff, sizeof(buff) - 1, 0);
        if (n > 0) {
            buff[n] = '\0';
            std::cout << buff << std::endl;
        } else {
            std::cerr << "no reply within " << timeoutSec << " s\n";
            rc = 1;
        }
    }

    closesock(s);
#ifdef _WIN32
    WSACleanup();
#endif
    return rc;
}
