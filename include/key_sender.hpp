#pragma once

#include "gesture_types.hpp"
#include <chrono>
#include <ostream>
#include <string>

namespace keys {

// Linux input keycode for an action, -1 for NONE
int action_to_keycode(gesture::Action a);

// Downstream key injection. NONE is always ignored.
class KeySender {
public:
    virtual ~KeySender() = default;

    // Press and release the arrow key for the action
    virtual bool send(gesture::Action action) = 0;

    virtual std::string name() const = 0;
};

// Virtual keyboard through /dev/uinput
class UinputKeySender : public KeySender {
public:
    UinputKeySender() = default;
    ~UinputKeySender() override;

    // Create the virtual device exposing the four arrow keys
    bool init(const std::string& device_path = "/dev/uinput");

    bool send(gesture::Action action) override;
    std::string name() const override { return "uinput"; }

    bool is_open() const { return fd_ >= 0; }
    const std::string& last_error() const { return last_error_; }

private:
    int fd_{-1};
    std::string last_error_;

    bool emit(int type, int code, int value);
    void close_device();

    // Disable copy
    UinputKeySender(const UinputKeySender&) = delete;
    UinputKeySender& operator=(const UinputKeySender&) = delete;
};

// Dry run: prints "Sent key: <action> at <seconds>"
class LoggingKeySender : public KeySender {
public:
    explicit LoggingKeySender(std::ostream& out);

    bool send(gesture::Action action) override;
    std::string name() const override { return "log"; }

private:
    std::ostream& out_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace keys
