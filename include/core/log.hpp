#ifndef LOG_HPP
#define LOG_HPP

#include <string>

// Console logging in the "[Component] [LEVEL] message" form.
// INFO/DEBUG go to stdout, WARN/ERROR to stderr.

void setLogVerbose(bool verbose);

void logDebug(const std::string& component, const std::string& msg);
void logInfo(const std::string& component, const std::string& msg);
void logWarn(const std::string& component, const std::string& msg);
void logError(const std::string& component, const std::string& msg);

#endif
