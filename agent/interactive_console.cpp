#include "interactive_console.h"
#include "progress_reporter.h"
#include "session.h"
#include <map>
#include <stdexcept>

InteractiveConsole::InteractiveConsole(Session& session, KeySource& keys, std::ostream& out,
                                       PasteUploader uploader)
    : session_(session)
    , keys_(keys)
    , out_(out)
    , uploader_(std::move(uploader))
    , state_(State::PassThrough)
    , exiting_(false) {
}

int InteractiveConsole::run() {
    state_ = State::PassThrough;
    exiting_ = false;

    std::ostream& out = out_;
    bool attached = session_.consoleAttach([&out](const std::string& data) {
        out << data << std::flush;
    });

    try {
        if (!attached) {
            out_ << "*** live console output is unavailable ***" << std::endl;
        }
        printSnapshot();
        loop();
    } catch (...) {
        session_.consoleDetach();
        throw;
    }

    session_.consoleDetach();
    return 0;
}

void InteractiveConsole::loop() {
    while (!exiting_) {
        std::optional<char> key = keys_.getKey();
        if (!key) {
            break;
        }

        if (state_ == State::MenuWait) {
            state_ = State::PassThrough;
            handleMenuKey(*key);
        } else if (*key == ESCAPE_KEY) {
            state_ = State::MenuWait;
        } else {
            session_.consoleSend(std::string(1, *key));
        }
    }
}

void InteractiveConsole::handleMenuKey(char key) {
    static const std::map<char, MenuCommand> menu = {
        {'a', MenuCommand::Acquire},
        {'b', MenuCommand::Paste},
        {'i', MenuCommand::Info},
        {'p', MenuCommand::Power},
        {'q', MenuCommand::Quit},
        {'r', MenuCommand::Release},
        {'s', MenuCommand::Storage},
        {'t', MenuCommand::Timestamps},
        {'u', MenuCommand::Usb},
    };

    auto it = menu.find(key);
    if (it != menu.end()) {
        execute(it->second);
    }
}

void InteractiveConsole::execute(MenuCommand cmd) {
    switch (cmd) {
        case MenuCommand::Acquire:
            acquireTarget();
            break;
        case MenuCommand::Paste:
            pasteConsole();
            break;
        case MenuCommand::Info:
            printSnapshot();
            break;
        case MenuCommand::Power:
            togglePower();
            break;
        case MenuCommand::Quit:
            exiting_ = true;
            break;
        case MenuCommand::Release:
            releaseTarget();
            break;
        case MenuCommand::Storage:
            toggleStorage();
            break;
        case MenuCommand::Timestamps:
            session_.toggleTimestamps();
            break;
        case MenuCommand::Usb:
            toggleUsb();
            break;
    }
}

std::string InteractiveConsole::lockDescription() {
    std::optional<std::string> owner = session_.targetOwner();
    if (!owner) {
        return "unlocked";
    }
    if (*owner == session_.id()) {
        return "locked";
    }
    return "locked by " + *owner;
}

void InteractiveConsole::printSnapshot() {
    std::string sd_lock = session_.sdLocked() ? "locked" : "available";

    out_ << "\n"
         << "Host           : " << session_.endpoint() << " (mtda " << session_.agentVersion() << ")\n"
         << "Session        : " << session_.id() << "\n"
         << "Target         : " << session_.targetStatus() << " (" << lockDescription() << ")\n"
         << "Shared storage : " << session_.sdStatus() << " (" << sd_lock << ")\n"
         << "Written        : " << formatSize(session_.sdBytesWritten()) << "\n";

    int ports = session_.usbPorts();
    for (int ndx = 1; ndx <= ports; ++ndx) {
        out_ << "USB #" << ndx << "         : " << session_.usbStatus(ndx) << "\n";
    }
    out_ << std::endl;
}

void InteractiveConsole::acquireTarget() {
    if (session_.targetLock()) {
        out_ << "\n*** Target was locked by " << session_.id() << " ***" << std::endl;
    } else {
        out_ << "\n*** Target is " << lockDescription() << " ***" << std::endl;
    }
}

void InteractiveConsole::releaseTarget() {
    if (session_.targetUnlock()) {
        out_ << "\n*** Target was unlocked ***" << std::endl;
    } else {
        out_ << "\n*** Target is " << lockDescription() << " ***" << std::endl;
    }
}

void InteractiveConsole::togglePower() {
    std::string before = session_.targetStatus();
    session_.targetToggle();
    std::string after = session_.targetStatus();
    if (before != after) {
        out_ << "\n*** Target is now " << after << " ***" << std::endl;
    }
}

void InteractiveConsole::toggleStorage() {
    std::string before = session_.sdStatus();
    std::string after = session_.sdToggle();
    if (before != after) {
        out_ << "\n*** SD card is now on the " << after << " ***" << std::endl;
    }
}

void InteractiveConsole::toggleUsb() {
    if (session_.usbPorts() < 1) {
        return;
    }
    if (session_.usbToggle(1)) {
        out_ << "\n*** USB #1 is now " << session_.usbStatus(1) << " ***" << std::endl;
    }
}

void InteractiveConsole::pasteConsole() {
    if (!uploader_) {
        out_ << "\n*** No paste service configured ***" << std::endl;
        return;
    }

    std::optional<std::string> data = session_.consoleFlush();
    if (!data || data->empty()) {
        out_ << "\n*** Console buffer is empty ***" << std::endl;
        return;
    }

    try {
        std::string link = uploader_(*data);
        out_ << "\n*** Console buffer uploaded to " << link << " ***" << std::endl;
    } catch (const std::runtime_error& e) {
        out_ << "\n*** Failed to upload console buffer: " << e.what() << " ***" << std::endl;
    }
}
