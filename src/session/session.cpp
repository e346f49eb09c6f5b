#include "session/session.hpp"

const char* toString(SessionState state) {
    switch (state) {
    case SessionState::Idle: return "IDLE";
    case SessionState::Recording: return "RECORDING";
    case SessionState::Stopping: return "STOPPING";
    case SessionState::Terminal: return "TERMINAL";
    }
    return "UNKNOWN";
}
