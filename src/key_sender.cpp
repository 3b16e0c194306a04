#include "key_sender.hpp"
#include <linux/input.h>
#include <linux/uinput.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>

namespace keys
{

    namespace
    {
        constexpr int kArrowKeys[] = {KEY_LEFT, KEY_RIGHT, KEY_UP, KEY_DOWN};
    } // namespace

    int action_to_keycode(gesture::Action a)
    {
        switch (a)
        {
        case gesture::Action::LEFT:
            return KEY_LEFT;
        case gesture::Action::RIGHT:
            return KEY_RIGHT;
        case gesture::Action::UP:
            return KEY_UP;
        case gesture::Action::DOWN:
            return KEY_DOWN;
        default:
            return -1;
        }
    }

    // UinputKeySender implementation
    UinputKeySender::~UinputKeySender()
    {
        close_device();
    }

    void UinputKeySender::close_device()
    {
        if (fd_ < 0)
            return;
        if (ioctl(fd_, UI_DEV_DESTROY) < 0)
            std::cerr << "[Keys] UI_DEV_DESTROY failed: " << strerror(errno) << "\n";
        close(fd_);
        fd_ = -1;
    }

    bool UinputKeySender::init(const std::string &device_path)
    {
        close_device();

        fd_ = open(device_path.c_str(), O_WRONLY | O_NONBLOCK);
        if (fd_ < 0)
        {
            last_error_ = "Failed to open " + device_path + ": " + strerror(errno);
            std::cerr << "[Keys] " << last_error_ << "\n";
            return false;
        }

        if (ioctl(fd_, UI_SET_EVBIT, EV_KEY) < 0)
        {
            last_error_ = std::string("UI_SET_EVBIT failed: ") + strerror(errno);
            std::cerr << "[Keys] " << last_error_ << "\n";
            close(fd_);
            fd_ = -1;
            return false;
        }
        for (int key : kArrowKeys)
        {
            if (ioctl(fd_, UI_SET_KEYBIT, key) < 0)
            {
                last_error_ = std::string("UI_SET_KEYBIT failed: ") + strerror(errno);
                std::cerr << "[Keys] " << last_error_ << "\n";
                close(fd_);
                fd_ = -1;
                return false;
            }
        }

        struct uinput_setup setup;
        std::memset(&setup, 0, sizeof(setup));
        setup.id.bustype = BUS_USB;
        setup.id.vendor = 0x1209;
        setup.id.product = 0x4b59;
        std::strncpy(setup.name, "handkeys virtual keyboard", UINPUT_MAX_NAME_SIZE - 1);

        if (ioctl(fd_, UI_DEV_SETUP, &setup) < 0 || ioctl(fd_, UI_DEV_CREATE) < 0)
        {
            last_error_ = std::string("Failed to create uinput device: ") + strerror(errno);
            std::cerr << "[Keys] " << last_error_ << "\n";
            close(fd_);
            fd_ = -1;
            return false;
        }

        std::cerr << "[Keys] Virtual keyboard created on " << device_path << "\n";
        return true;
    }

    bool UinputKeySender::emit(int type, int code, int value)
    {
        struct input_event ev;
        std::memset(&ev, 0, sizeof(ev));
        ev.type = static_cast<__u16>(type);
        ev.code = static_cast<__u16>(code);
        ev.value = value;

        ssize_t n = write(fd_, &ev, sizeof(ev));
        if (n != static_cast<ssize_t>(sizeof(ev)))
        {
            last_error_ = std::string("write failed: ") + (n < 0 ? strerror(errno) : "short write");
            return false;
        }
        return true;
    }

    bool UinputKeySender::send(gesture::Action action)
    {
        const int code = action_to_keycode(action);
        if (code < 0)
            return true;

        if (fd_ < 0)
        {
            last_error_ = "Device not initialized";
            return false;
        }

        return emit(EV_KEY, code, 1) &&
               emit(EV_SYN, SYN_REPORT, 0) &&
               emit(EV_KEY, code, 0) &&
               emit(EV_SYN, SYN_REPORT, 0);
    }

    // LoggingKeySender implementation
    LoggingKeySender::LoggingKeySender(std::ostream &out)
        : out_(out), start_(std::chrono::steady_clock::now())
    {
    }

    bool LoggingKeySender::send(gesture::Action action)
    {
        if (action == gesture::Action::NONE)
            return true;

        const double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        out_ << "Sent key: " << gesture::action_to_string(action)
             << " at " << std::fixed << std::setprecision(2) << t << "\n";
        return static_cast<bool>(out_);
    }

} // namespace keys
