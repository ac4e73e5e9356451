#ifndef AUDIOMIRROR_CLI_PARSER_HPP
#define AUDIOMIRROR_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include "../../../libaudiomirror/include/mirror_options.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    audiomirror::MirrorOptions options;

    bool quiet = false;
    bool verbose = false;
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    // raw option values, folded into options by the parser callback
    std::string transcode_formats = "flac,wv,wav,ape,fla";
    std::string extra_encoder_options;
    std::string transcoder;
    std::string copier;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //AUDIOMIRROR_CLI_PARSER_HPP
