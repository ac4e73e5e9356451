#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <system_error>

namespace fs = std::filesystem;

namespace {
// resolve symlinks like realpath(3); a missing path is kept as given
fs::path resolve_path(const fs::path& p) {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(p, ec);
    return ec ? p : resolved;
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    auto& opts = settings.options;

    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-n,--dry-run", opts.dry_run,
                 "Don't actually modify anything.");

    app.add_flag("-f,--force", opts.force,
                 "Update destination files even if they are newer.");

    app.add_flag("-z,--include-hidden", opts.include_hidden,
                 "Don't skip directories and files starting with a dot.");

    app.add_flag("-D,--delete", opts.delete_extra,
                 "Delete files in the destination that do not have a corresponding file in the source directory.");

    auto* quiet = app.add_flag("-q,--quiet", settings.quiet,
                               "Do not print informational messages.");

    app.add_flag("-v,--verbose", settings.verbose,
                 "Print debug messages that are probably only useful if something is going wrong.")
        ->excludes(quiet);

    // --- Options ---
    app.add_option("-j,--jobs", opts.jobs,
                   "Number of transfers to run in parallel. The default is the number of cores "
                   "available on the system. 0 and 1 both run transfers one at a time.")
        ->default_val(opts.jobs)
        ->check(CLI::NonNegativeNumber);

    app.add_option("-i,--transcode-formats,--transcode_formats", settings.transcode_formats,
                   "A comma-separated list of input file extensions that must be transcoded.")
        ->default_val(settings.transcode_formats);

    app.add_option("-o,--target-format", opts.target_format,
                   "All input transcode formats will be transcoded to this output format.")
        ->default_val(opts.target_format);

    app.add_option("-E,--extra-encoder-options", settings.extra_encoder_options,
                   "Extra options to pass to the encoder, through pacpl's '--eopts' option.");

    app.add_option("--transcoder", settings.transcoder,
                   "Perl Audio Converter executable (default: pacpl on PATH).");

    app.add_option("--copier", settings.copier,
                   "rsync executable used for copies that cannot be hard linked (default: rsync on PATH).");

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to this file.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last();

    // --- Positional Arguments ---
    app.add_option("source_directory", opts.source_directory,
                   "The directory with all your music in it.")
        ->required()
        ->check(CLI::ExistingDirectory);

    app.add_option("destination_directory", opts.destination_directory,
                   "The directory where output files will go. The directory hierarchy of the "
                   "source directory will be replicated here.")
        ->required()
        ->check([](const std::string& str) {
            if (fs::exists(str) && !fs::is_directory(str)) return "Not a directory: " + str;
            return std::string(); // ok
        });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        auto& o = settings.options;
        o.source_directory = resolve_path(o.source_directory);
        o.destination_directory = resolve_path(o.destination_directory);
        if (!fs::is_directory(o.source_directory)) {
            throw CLI::ValidationError("Not a directory: " + o.source_directory.string());
        }

        o.transcode_formats = audiomirror::parse_extension_list(settings.transcode_formats);
        if (!settings.extra_encoder_options.empty()) {
            o.extra_encoder_options = settings.extra_encoder_options;
        }
        if (!settings.transcoder.empty()) o.transcoder = settings.transcoder;
        if (!settings.copier.empty()) o.copier = settings.copier;
    });
}
