#include <iostream>
#include <fstream>
#include <cstdlib>
#include <csignal>
#include <cstring>
#include <string>
#include <memory>
#include <iomanip>
#include <signal.h>

#include "gesture_config.hpp"
#include "gesture_controller.hpp"
#include "gesture_errors.hpp"
#include "key_sender.hpp"
#include "landmark_reader.hpp"

static controller::GestureController *g_controller = nullptr;

static void on_sigint(int)
{
    if (g_controller)
        g_controller->stop();
}

static void print_usage()
{
    std::cout << "handkeys Options:\n"
              << "  --config <path>       Gesture configuration (key/value or .json, env HANDKEYS_CONFIG)\n"
              << "  --input <path|->      Landmark stream, one JSON frame per line (default: stdin)\n"
              << "  --uinput [device]     Inject arrow keys through uinput (default: /dev/uinput)\n"
              << "  --dry-run             Print keys instead of injecting them (default)\n"
              << "  --skip-frames <n>     Evaluate only every (n+1)-th frame\n"
              << "  --save-config <path>  Write the effective configuration and exit\n"
              << "  --verbose             Per-frame decision log on stderr\n"
              << "  --help                Show this help\n\n";
}

static void print_stats(const controller::ControllerStats &stats,
                        const gesture::StabilizerStats &stab,
                        const landmarks::ReaderStats &reader)
{
    std::cout << "\n=== Session statistics ===\n"
              << "  Lines read:          " << reader.lines_read << " (malformed: " << reader.malformed_lines << ")\n"
              << "  Frames received:     " << stats.frames_received << "\n"
              << "  Frames evaluated:    " << stats.frames_evaluated << " (skipped: " << stats.frames_skipped << ")\n"
              << "  Frames without hand: " << stats.frames_without_hand << "\n"
              << "  Invalid frames:      " << stats.invalid_frames << "\n"
              << "  Held by hysteresis:  " << stab.frames_held << "\n"
              << "  Cooldown suppressed: " << stab.suppressed_by_cooldown << "\n"
              << "  Keys sent:           " << stats.total_emitted()
              << " (left " << stats.emitted_count(gesture::Action::LEFT)
              << ", right " << stats.emitted_count(gesture::Action::RIGHT)
              << ", up " << stats.emitted_count(gesture::Action::UP)
              << ", down " << stats.emitted_count(gesture::Action::DOWN) << ")\n"
              << "  Send failures:       " << stats.send_failures << "\n"
              << "  Avg process time:    " << std::fixed << std::setprecision(3)
              << stats.avg_process_time_ms << " ms\n";
}

int main(int argc, char **argv)
{
    // ---------------------------------------------------------------------------
    // Startup argument parsing (lightweight, no external deps)
    // ---------------------------------------------------------------------------
    std::string config_path;
    std::string input_path = "-";
    std::string uinput_device;
    std::string save_config_path;
    bool use_uinput = false;
    controller::ControllerConfig ctrl_cfg;
    bool verbose = false;

    if (const char *env = std::getenv("HANDKEYS_CONFIG"))
        config_path = env;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--input" && i + 1 < argc)
        {
            input_path = argv[++i];
        }
        else if (arg == "--uinput")
        {
            use_uinput = true;
            uinput_device = "/dev/uinput";
            if (i + 1 < argc && argv[i + 1][0] != '-')
                uinput_device = argv[++i];
        }
        else if (arg == "--dry-run")
        {
            use_uinput = false;
        }
        else if (arg == "--skip-frames" && i + 1 < argc)
        {
            const std::string value = argv[++i];
            size_t used = 0;
            try
            {
                ctrl_cfg.skip_frames = std::stoi(value, &used);
            }
            catch (const std::exception &)
            {
                used = 0;
            }
            if (used == 0 || used != value.size())
            {
                std::cerr << "Invalid value for --skip-frames: " << value << "\n";
                return 1;
            }
        }
        else if (arg == "--save-config" && i + 1 < argc)
        {
            save_config_path = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    gesture::GestureConfig gesture_cfg;
    if (!config_path.empty())
    {
        if (!gesture_cfg.load_from_file(config_path))
        {
            std::cerr << "Failed to load configuration: " << config_path << "\n";
            return 1;
        }
        std::cerr << "[GestureConfig] Loaded " << config_path << "\n";
    }
    if (verbose)
        gesture_cfg.verbose = true;
    ctrl_cfg.verbose = gesture_cfg.verbose;

    if (!save_config_path.empty())
    {
        if (!gesture_cfg.save_to_file(save_config_path))
            return 1;
        std::cout << "Configuration written to " << save_config_path << "\n";
        return 0;
    }

    std::unique_ptr<keys::KeySender> sender;
    if (use_uinput)
    {
        auto uinput = std::make_unique<keys::UinputKeySender>();
        if (!uinput->init(uinput_device))
        {
            std::cerr << "Key injection unavailable: " << uinput->last_error() << "\n";
            return 1;
        }
        sender = std::move(uinput);
    }
    else
    {
        sender = std::make_unique<keys::LoggingKeySender>(std::cout);
    }

    std::ifstream file;
    std::istream *in = &std::cin;
    if (input_path != "-")
    {
        file.open(input_path);
        if (!file.is_open())
        {
            std::cerr << "Failed to open landmark stream: " << input_path << "\n";
            return 1;
        }
        in = &file;
    }

    std::unique_ptr<controller::GestureController> ctrl;
    try
    {
        ctrl = std::make_unique<controller::GestureController>(gesture_cfg, ctrl_cfg, *sender);
    }
    catch (const gesture::ConfigurationError &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    // No SA_RESTART: a blocked read on the landmark stream returns on Ctrl+C
    g_controller = ctrl.get();
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::cout << "Starting hand gesture control:\n"
              << "- Point UP to JUMP\n"
              << "- Point LEFT/RIGHT to STEER\n"
              << "- Make a FIST to ROLL\n"
              << "- Hand flat/open = NEUTRAL (no input)\n"
              << "Keys go to: " << sender->name() << ". Press Ctrl+C to quit.\n";

    landmarks::LandmarkReader reader(*in, gesture_cfg.verbose);
    ctrl->run(reader);

    g_controller = nullptr;
    print_stats(ctrl->get_stats(), ctrl->stabilizer().get_stats(), reader.get_stats());
    return 0;
}
