#include "app.hpp"
#include "config.hpp"
#include "process.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>

static wayvox::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config PATH     Config file (default: ~/.config/wayvox/config.json)\n"
              << "  -l, --language LANG   Language code, disables auto-detect (e.g. ru, en)\n"
              << "  -k, --keycode N       Trigger key code (default: 194 = KEY_F24)\n"
              << "  --max-duration S      Stop recording after S seconds (default: 30)\n"
              << "  --no-paste            Don't type the text, only copy it\n"
              << "  --no-clipboard        Don't copy the text to the clipboard\n"
              << "  --notify              Show desktop notifications\n"
              << "  -v, --verbose         Log dropped triggers\n"
              << "  -h, --help            Show this help\n"
              << "\nHotkey:\n"
              << "  Press the trigger key to start recording, press it again to transcribe.\n"
              << "  Map a combination to F24 with keyd, e.g. control+space = f24.\n"
              << "  Reading /dev/input requires membership in the 'input' group.\n"
              << "\nAPI key:\n"
              << "  Set api.key in the config file or export WAYVOX_API_KEY.\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path = wayvox::default_config_path();

    // The config file has to be known before other options override it
    for (int i = 1; i < argc; ++i) {
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }

    std::string load_error;
    wayvox::Config config = wayvox::load_config(config_path, &load_error);
    if (!load_error.empty()) {
        std::cerr << "Failed to load config: " << load_error << " (using defaults)" << std::endl;
    }

    const char* env_key = std::getenv("WAYVOX_API_KEY");
    if (env_key && *env_key) {
        config.api.key = env_key;
    }

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            ++i;
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            config.languages.primary = argv[++i];
            config.languages.auto_detect = false;
        }
        else if ((strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--keycode") == 0) && i + 1 < argc) {
            config.hotkey.keycode = static_cast<uint32_t>(std::atoi(argv[++i]));
        }
        else if (strcmp(argv[i], "--max-duration") == 0 && i + 1 < argc) {
            int seconds = std::atoi(argv[++i]);
            if (seconds <= 0) {
                std::cerr << "Invalid max duration: " << argv[i] << std::endl;
                return 1;
            }
            config.audio.max_duration = seconds;
        }
        else if (strcmp(argv[i], "--no-paste") == 0) {
            config.behavior.auto_paste = false;
        }
        else if (strcmp(argv[i], "--no-clipboard") == 0) {
            config.behavior.copy_to_clipboard = false;
        }
        else if (strcmp(argv[i], "--notify") == 0) {
            config.behavior.show_notification = true;
        }
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    wayvox::ignore_sigpipe();

    wayvox::App app;
    g_app = &app;

    std::cout << "WayVox - Voice dictation daemon\n" << std::endl;
    std::cout << "Config: " << config_path << std::endl;
    std::cout << "Model: " << config.api.model << std::endl;
    std::cout << "Language: " << (config.languages.auto_detect ? "auto-detect" : config.languages.primary) << std::endl;
    std::cout << "Trigger key: " << config.hotkey.keycode << std::endl;
    std::cout << "Auto-paste: " << (config.behavior.auto_paste ? "yes" : "no") << std::endl;
    std::cout << "Copy to clipboard: " << (config.behavior.copy_to_clipboard ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        return 1;
    }

    int result = app.run();

    std::cout << "Shutting down..." << std::endl;
    app.shutdown();

    g_app = nullptr;
    return result;
}
