#include "control/frontend_notifier.hpp"
#include "core/log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

using nlohmann::json;

std::string sessionDoneMessage(uint64_t sessionId, long long ts) {
    return json{{"type", "session_done"}, {"session", sessionId}, {"ts", ts}}.dump();
}

std::string rejectedMessage(const std::string& command, const std::string& reason) {
    return json{{"type", "rejected"}, {"command", command}, {"reason", reason}}.dump();
}

std::string uiRequestMessage(UiRequest ui) {
    return json{{"type", "ui_request"}, {"ui", toString(ui)}}.dump();
}

std::string staticDoneMessage(const std::string& path, bool ok) {
    return json{{"type", "static_done"}, {"path", path}, {"ok", ok}}.dump();
}

std::string sessionAbortedMessage(uint64_t sessionId, const std::string& reason) {
    return json{{"type", "session_aborted"}, {"session", sessionId}, {"reason", reason}}.dump();
}

std::string shutdownMessage() {
    return json{{"type", "shutdown"}}.dump();
}

// Constructor
FrontendNotifier::FrontendNotifier(CommandServer& server) : server_(server) {}

void FrontendNotifier::send(const std::string& payload) {
    if (!server_.sendToActive(payload)) {
        logDebug("Notifier", "no active client for " + payload);
    }
}

void FrontendNotifier::onCommandRejected(const std::string& command, const std::string& reason) {
    send(rejectedMessage(command, reason));
}

void FrontendNotifier::onSessionDone(uint64_t sessionId, const std::string& /*transcript*/) {
    const auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    send(sessionDoneMessage(sessionId, (long long)ts));
}

void FrontendNotifier::onSessionAborted(uint64_t sessionId, const std::string& reason) {
    send(sessionAbortedMessage(sessionId, reason));
}

void FrontendNotifier::onUiRequest(UiRequest ui) { send(uiRequestMessage(ui)); }

void FrontendNotifier::onStaticDone(const std::string& path, bool ok) { send(staticDoneMessage(path, ok)); }

void FrontendNotifier::onShutdown() { send(shutdownMessage()); }
