#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <iostream>

namespace speedwire_opts {

struct ProviderHolder { std::function<void(CLI::App&, const nlohmann::json&)> cb; };

static std::vector<ProviderHolder>& providers() {
    static std::vector<ProviderHolder> p;
    return p;
}

// Store the loaded config file path (if any) so that option providers can resolve relative paths.
static std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p; return p;
}

struct AppInfo {
    std::string name{"speedwire"};
    std::string version{"0.1"};
};

static AppInfo& app_info() {
    static AppInfo info;
    return info;
}

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::set_app_info(std::string name, std::string version) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    app_info() = AppInfo{std::move(name), std::move(version)};
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(ProviderHolder{std::move(p)});
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    AppInfo info;
    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        info = app_info();
    }
    CLI::App app{info.name};
    app.set_version_flag("-V,--version", info.name + " " + info.version);

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Minimal pre-parser to discover -c/--config early, so the JSON config can
    // seed provider defaults before the strict parse below.
    CLI::App config_probe{"config_probe"};
    config_probe.add_option("-c,--config", config_file);
    // Accept unknown arguments during probing; the real app knows them.
    config_probe.allow_extras(true);
    config_probe.set_help_flag();
    try {
        config_probe.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        err = std::string{"config option: "} + e.what();
        return ParseResult::Error;
    }

    nlohmann::json cfg_json = nlohmann::json::object();
    loaded_config_file_storage().reset();
    if (!config_file.empty()) {
        std::ifstream ifs(config_file);
        if (!ifs) {
            err = "cannot open config file: " + config_file;
            return ParseResult::Error;
        }
        try {
            ifs >> cfg_json;
        } catch (const nlohmann::json::exception& e) {
            err = "malformed config file " + config_file + ": " + e.what();
            return ParseResult::Error;
        }
        std::error_code ec;
        std::filesystem::path abs = std::filesystem::absolute(config_file, ec);
        if (!ec) {
            loaded_config_file_storage() = abs;
        }
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto &ph : providers()) {
            if (ph.cb) ph.cb(app, cfg_json);
        }
    }

    app.allow_extras(false);
    app.require_subcommand(0);
    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion &v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const std::exception &e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto &s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

}
