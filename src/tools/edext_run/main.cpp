/// @file main.cpp
/// @brief edext_run: headless plugin runner.
///
/// Loads the configuration and plugin tree, opens one file into a
/// MemoryBridge, then lists commands, runs a trigger or fires an editor
/// event. The buffer is written back when a plugin changed it.

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "edext/edext.hpp"

namespace {

namespace fs = std::filesystem;
namespace kci = kcenon::common::interfaces;

using edext::foundation::ConfigManager;
using edext::foundation::EngineConfig;

/// Writes every log record to stderr.
class StderrLogger : public kci::ILogger {
public:
    kcenon::common::VoidResult log(kci::log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return kcenon::common::VoidResult::ok(std::monostate{});
        }
        std::lock_guard lock(mutex_);
        std::cerr << "edext: " << message << '\n';
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(kci::log_level level, std::string_view message,
                                   const kci::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level level) const override { return level >= level_; }

    kcenon::common::VoidResult set_level(kci::log_level level) override {
        level_ = level;
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override { return level_; }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        std::cerr.flush();
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    std::mutex mutex_;
    kci::log_level level_ = kci::log_level::trace;
};

struct Options {
    fs::path configPath;
    fs::path pluginRoot;
    fs::path file;
    std::string select;
    bool list = false;
    std::string trigger;
    std::string event;
    bool help = false;
};

void printUsage(std::ostream& os) {
    os << "usage: edext_run [--config FILE] [--plugins DIR] [--file FILE] [--select TEXT]\n"
          "                 (--list | --trigger PLUGIN:TRIGGER | --event on_save|on_open)\n";
}

std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        };

        if (arg == "--list") {
            opts.list = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--config" || arg == "--plugins" || arg == "--file" ||
                   arg == "--trigger" || arg == "--event" || arg == "--select") {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            if (arg == "--config") {
                opts.configPath = *value;
            } else if (arg == "--plugins") {
                opts.pluginRoot = *value;
            } else if (arg == "--file") {
                opts.file = *value;
            } else if (arg == "--trigger") {
                opts.trigger = *value;
            } else if (arg == "--event") {
                opts.event = *value;
            } else {
                opts.select = *value;
            }
        } else {
            std::cerr << "unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return opts;
}

/// Load the resolved configuration file. A missing default file is not an
/// error; a file named explicitly (flag or environment) must load.
bool loadConfig(ConfigManager& config, const fs::path& cliPath) {
    fs::path fallback;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        fallback = fs::path(xdg) / "edext" / "config.yaml";
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        fallback = fs::path(home) / ".config" / "edext" / "config.yaml";
    }

    auto path = edext::foundation::resolveConfigPath(cliPath, fallback);
    if (path.empty()) {
        return true;
    }
    std::error_code ec;
    if (path == fallback && !fs::exists(path, ec)) {
        return true;
    }

    auto loaded = config.load(path);
    if (!loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
        return false;
    }
    return true;
}

std::optional<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool writeFile(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
    return static_cast<bool>(out);
}

void printNotifications(const edext::bridge::MemoryBridge& bridge) {
    for (const auto& n : bridge.notifications()) {
        std::cout << "[" << n.title << "] " << n.message << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }
    if (opts->help) {
        printUsage(std::cout);
        return EXIT_SUCCESS;
    }
    int modes = (opts->list ? 1 : 0) + (opts->trigger.empty() ? 0 : 1) +
                (opts->event.empty() ? 0 : 1);
    if (modes != 1) {
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    kci::GlobalLoggerRegistry::instance().set_default_logger(std::make_shared<StderrLogger>());

    ConfigManager config;
    if (!loadConfig(config, opts->configPath)) {
        return EXIT_FAILURE;
    }
    auto engineConfig = EngineConfig::FromConfig(config);
    if (!opts->pluginRoot.empty()) {
        engineConfig.pluginRoot = opts->pluginRoot;
    }
    edext::foundation::EngineLogger::instance().setAllLevels(engineConfig.logLevel);

    std::string text;
    std::optional<fs::path> filePath;
    std::string language(edext::bridge::kDefaultLanguage);
    if (!opts->file.empty()) {
        std::error_code ec;
        if (fs::exists(opts->file, ec)) {
            auto contents = readFile(opts->file);
            if (!contents) {
                std::cerr << "Cannot read " << opts->file.string() << "\n";
                return EXIT_FAILURE;
            }
            text = std::move(*contents);
        }
        filePath = opts->file;
        language = edext::bridge::languageForPath(opts->file);
    }
    edext::bridge::MemoryBridge bridge(std::move(text), filePath, language);
    if (!opts->select.empty() && !bridge.SelectText(opts->select)) {
        std::cerr << "Selection text not found: " << opts->select << "\n";
        return EXIT_FAILURE;
    }

    edext::host::PluginHost host(engineConfig, bridge);
    auto started = host.Start();
    if (!started) {
        std::cerr << "Failed to load plugins: " << started.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (opts->list) {
        printNotifications(bridge);
        for (const auto& cmd : host.Commands()) {
            std::cout << cmd.pluginName << ":" << cmd.triggerId << "\t" << cmd.label;
            if (!cmd.shortcut.empty()) {
                std::cout << "\t" << cmd.shortcut;
            }
            std::cout << "\n";
        }
        return EXIT_SUCCESS;
    }

    auto revision = bridge.revision();
    int status = EXIT_SUCCESS;

    if (!opts->trigger.empty()) {
        auto colon = opts->trigger.find(':');
        if (colon == std::string::npos) {
            std::cerr << "--trigger expects PLUGIN:TRIGGER\n";
            return EXIT_FAILURE;
        }
        auto result = host.ExecuteTrigger(opts->trigger.substr(0, colon),
                                          opts->trigger.substr(colon + 1));
        if (!result) {
            std::cerr << "Trigger failed: " << result.error().message() << "\n";
            status = EXIT_FAILURE;
        }
    } else if (opts->event == "on_save" || opts->event == "on_open") {
        auto outcomes = opts->event == "on_save" ? host.OnFileSaved() : host.OnFileOpened();
        for (const auto& outcome : outcomes) {
            if (!outcome.result) {
                status = EXIT_FAILURE;
            }
        }
    } else {
        std::cerr << "unknown event: " << opts->event << "\n";
        return EXIT_FAILURE;
    }

    printNotifications(bridge);

    if (bridge.revision() != revision && !opts->file.empty()) {
        if (!writeFile(opts->file, bridge.text())) {
            std::cerr << "Cannot write " << opts->file.string() << "\n";
            return EXIT_FAILURE;
        }
    }
    return status;
}
