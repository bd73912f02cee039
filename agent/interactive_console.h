#pragma once

#include <functional>
#include <ostream>
#include <string>
#include "key_source.h"

class Session;

// Forwards keystrokes to the target console until the user quits. The
// escape key switches to a one-key menu for power, SD card and lock control.
class InteractiveConsole {
public:
    using PasteUploader = std::function<std::string(const std::string& text)>;

    static constexpr char ESCAPE_KEY = 0x01;

    enum class State { PassThrough, MenuWait };
    enum class MenuCommand { Acquire, Paste, Info, Power, Quit, Release, Storage, Timestamps, Usb };

    InteractiveConsole(Session& session, KeySource& keys, std::ostream& out,
                       PasteUploader uploader = nullptr);

    int run();
    void printSnapshot();

    State state() const { return state_; }

private:
    Session& session_;
    KeySource& keys_;
    std::ostream& out_;
    PasteUploader uploader_;
    State state_;
    bool exiting_;

    void loop();
    void handleMenuKey(char key);
    void execute(MenuCommand cmd);

    void acquireTarget();
    void releaseTarget();
    void togglePower();
    void toggleStorage();
    void toggleUsb();
    void pasteConsole();
    std::string lockDescription();
};
