#include "local_session.h"
#include "agent.h"

LocalSession::LocalSession(Agent& agent, const std::string& session_id)
    : agent_(agent)
    , session_id_(session_id) {
}

std::string LocalSession::agentVersion() {
    return agent_.version();
}

bool LocalSession::consoleAttach(ConsoleSink sink) {
    agent_.setConsoleSink(std::move(sink));
    return agent_.consoleLogger() != nullptr;
}

void LocalSession::consoleDetach() {
    agent_.setConsoleSink(nullptr);
}

bool LocalSession::consoleClear() { return agent_.consoleClear(session_id_); }
std::optional<std::string> LocalSession::consoleFlush() { return agent_.consoleFlush(session_id_); }
std::optional<std::string> LocalSession::consoleHead() { return agent_.consoleHead(session_id_); }
std::optional<size_t> LocalSession::consoleLines() { return agent_.consoleLines(session_id_); }
bool LocalSession::consoleLocked() { return agent_.consoleLocked(session_id_); }

std::optional<std::string> LocalSession::consolePrompt(const std::optional<std::string>& new_prompt) {
    return agent_.consolePrompt(new_prompt, session_id_);
}

std::optional<std::string> LocalSession::consoleRun(const std::string& cmd) {
    return agent_.consoleRun(cmd, session_id_);
}

bool LocalSession::consoleSend(const std::string& data) { return agent_.consoleSend(data, session_id_); }
std::optional<std::string> LocalSession::consoleTail() { return agent_.consoleTail(session_id_); }
bool LocalSession::toggleTimestamps() { return agent_.toggleTimestamps(); }

bool LocalSession::targetLock() { return agent_.targetLock(session_id_); }
bool LocalSession::targetLocked() { return agent_.targetLocked(session_id_); }
std::optional<std::string> LocalSession::targetOwner() { return agent_.targetOwner(); }
bool LocalSession::targetOn() { return agent_.targetOn(session_id_); }
bool LocalSession::targetOff() { return agent_.targetOff(session_id_); }
std::string LocalSession::targetStatus() { return agent_.targetStatus(session_id_); }
std::string LocalSession::targetToggle() { return agent_.targetToggle(session_id_); }
bool LocalSession::targetUnlock() { return agent_.targetUnlock(session_id_); }

uint64_t LocalSession::sdBytesWritten() { return agent_.sdBytesWritten(session_id_); }
bool LocalSession::sdClose() { return agent_.sdClose(session_id_); }
bool LocalSession::sdLocked() { return agent_.sdLocked(session_id_); }
bool LocalSession::sdMount(const std::optional<std::string>& part) { return agent_.sdMount(part, session_id_); }
bool LocalSession::sdOpen() { return agent_.sdOpen(session_id_); }
std::string LocalSession::sdStatus() { return agent_.sdStatus(session_id_); }
bool LocalSession::sdToHost() { return agent_.sdToHost(session_id_); }
bool LocalSession::sdToTarget() { return agent_.sdToTarget(session_id_); }
std::string LocalSession::sdToggle() { return agent_.sdToggle(session_id_); }

int64_t LocalSession::sdUpdate(const std::string& dst, uint64_t offset, const std::string& data) {
    return agent_.sdUpdate(dst, offset, data, session_id_);
}

int64_t LocalSession::sdWrite(const std::string& data) { return agent_.sdWrite(data, session_id_); }

bool LocalSession::usbHasClass(const std::string& class_name) { return agent_.usbHasClass(class_name, session_id_); }
bool LocalSession::usbOffByClass(const std::string& class_name) { return agent_.usbOffByClass(class_name, session_id_); }
bool LocalSession::usbOnByClass(const std::string& class_name) { return agent_.usbOnByClass(class_name, session_id_); }
int LocalSession::usbPorts() { return agent_.usbPorts(session_id_); }
std::string LocalSession::usbStatus(int ndx) { return agent_.usbStatus(ndx, session_id_); }
bool LocalSession::usbToggle(int ndx) { return agent_.usbToggle(ndx, session_id_); }
