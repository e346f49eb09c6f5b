#ifndef FRONTEND_NOTIFIER_HPP
#define FRONTEND_NOTIFIER_HPP

#include "control/command_server.hpp"
#include "session/engine.hpp"

#include <string>

// Answers the active front-end client with one-line JSON messages.
class FrontendNotifier : public EngineListener {
public:
    explicit FrontendNotifier(CommandServer& server);

    void onCommandRejected(const std::string& command, const std::string& reason) override;
    void onSessionDone(uint64_t sessionId, const std::string& transcript) override;
    void onSessionAborted(uint64_t sessionId, const std::string& reason) override;
    void onUiRequest(UiRequest ui) override;
    void onStaticDone(const std::string& path, bool ok) override;
    void onShutdown() override;

private:
    void send(const std::string& payload);

    CommandServer& server_;
};

// Message builders, exposed for the sender tool and tests.
std::string sessionDoneMessage(uint64_t sessionId, long long ts);
std::string rejectedMessage(const std::string& command, const std::string& reason);
std::string uiRequestMessage(UiRequest ui);
std::string staticDoneMessage(const std::string& path, bool ok);
std::string sessionAbortedMessage(uint64_t sessionId, const std::string& reason);
std::string shutdownMessage();

#endif
