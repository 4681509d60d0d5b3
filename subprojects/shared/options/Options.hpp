/**
 * \file subprojects/shared/options/Options.hpp
 * \brief Command line and JSON config parsing shared by every option provider.
 */
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace procsync_opts {

/**
 * \brief Registry of option providers plus the two-phase parse.
 *
 * The first phase only looks for \c -c/--config and loads that JSON file.
 * Every provider then registers its options on the real app, taking defaults
 * from the loaded document, and the full command line is parsed strictly.
 * Values given on the command line always win over the file.
 */
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    /** \brief Register a provider; normally called from a static initializer. */
    static void add_provider(Provider p);
    /**
     * \brief Load the config file (if any) and parse \p argv.
     * \param err Receives a description when the result is \c Error.
     */
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    /**
     * \brief Read a JSON config document.
     * \return false with \p err set when the file is missing or malformed.
     */
    static bool load_config_file(const std::string& path, nlohmann::json& out, std::string& err);
    // Directory of the loaded config file (if any). Useful for resolving relative paths in providers.
    static std::optional<std::filesystem::path> get_config_dir();
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();

private:
    static std::mutex& providers_mutex();
};

} // namespace procsync_opts
