// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/cli/progress_bar.hpp>
#include <ferry/core/downloader.hpp>
#include <ferry/core/url.hpp>
#include <ferry/queue/admission_queue.hpp>
#include <ferry/service/transfer_service.hpp>
#include <ferry/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>

namespace ferry::cli {

namespace {

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Output name for a URL: -o wins for a single URL, else the URL's last segment
std::string output_name(const CliArgs& args, const std::string& url) {
    if (args.urls.size() == 1 && !args.output_file.empty()) {
        return args.output_file;
    }
    auto parsed = core::Url::parse(url);
    return parsed ? parsed->filename() : std::string("index.html");
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> std::optional<std::string> {
        if (i + 1 < argc) {
            return std::string(argv[++i]);
        }
        args.errors.push_back(std::string(option) + " needs a value");
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "--skip-existing") {
            args.skip_existing = true;
        } else if (arg == "--worker") {
            args.worker = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value_of(i, arg)) args.output_file = *v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.output_dir = *v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_file = *v;
        } else if (arg == "-n" || arg == "--segments") {
            if (auto v = value_of(i, arg)) {
                auto n = parse_number<std::uint32_t>(*v);
                if (n && *n > 0) {
                    args.segments = *n;
                } else {
                    args.errors.push_back("invalid segment count: " + *v);
                }
            }
        } else if (arg == "--max-size") {
            if (auto v = value_of(i, arg)) {
                auto n = parse_number<std::uint64_t>(*v);
                if (n && *n > 0) {
                    args.max_size = *n;
                } else {
                    args.errors.push_back("invalid size limit: " + *v);
                }
            }
        } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
            args.urls.push_back(arg);
        } else {
            args.errors.push_back("unknown option: " + arg);
        }
    }

    return args;
}

std::expected<core::Settings, std::error_code> resolve_settings(const CliArgs& args) noexcept {
    try {
        core::Settings settings;
        if (!args.config_file.empty()) {
            auto loaded = core::load_settings(args.config_file);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            settings = std::move(*loaded);
        }

        if (!args.output_dir.empty()) settings.output_dir = args.output_dir;
        if (args.segments > 0) settings.download.max_workers = args.segments;
        if (args.verbose) settings.log.level = "debug";
        else if (args.quiet) settings.log.level = "warn";

        if (auto ec = core::validate(settings.download)) {
            return std::unexpected(ec);
        }
        return settings;
    } catch (const std::exception&) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args, const core::Settings& settings) noexcept {
    try {
        // Declared ahead of the queue: its destructor drains jobs that use them
        core::Downloader downloader(settings.download, settings.output_dir);
        std::mutex out_mutex;
        auto bar = std::make_shared<ProgressBar>(std::cout, "Downloading");

        auto created = queue::AdmissionQueue::create(settings.queue);
        if (!created) {
            std::cerr << "Error: " << created.error().message() << std::endl;
            return std::unexpected(created.error());
        }
        auto& queue = **created;
        service::TransferService transfers(queue, downloader);

        // The bar only makes sense for a single transfer
        const bool show_bar = !args.quiet && args.urls.size() == 1;

        struct Pending {
            std::string url;
            std::future<service::TransferResult> result;
        };
        std::vector<Pending> pending;
        int exit_code = 0;

        for (const auto& url : args.urls) {
            service::TransferRequest request;
            request.url = url;
            request.filename = output_name(args, url);
            request.skip_if_exists = args.skip_existing;
            request.max_size_bytes = args.max_size;
            request.source = "cli";
            if (show_bar) {
                request.on_progress = [bar, &out_mutex](const core::DownloadProgress& p) {
                    std::lock_guard<std::mutex> lock(out_mutex);
                    bar->update(p);
                };
            }

            auto submitted = transfers.fetch_async(std::move(request));
            if (!submitted) {
                std::cerr << "Error: " << url << ": " << ferry::user_message(submitted.error()) << std::endl;
                exit_code = 1;
                continue;
            }
            pending.push_back({url, std::move(*submitted)});
        }

        for (auto& job : pending) {
            auto result = job.result.get();
            std::lock_guard<std::mutex> lock(out_mutex);
            if (show_bar) bar->finish();

            if (!result) {
                std::cerr << "Error: " << job.url << ": " << ferry::user_message(result.error()) << std::endl;
                exit_code = 1;
                continue;
            }

            core::log_download_metrics("cli", *result);
            if (!args.quiet) {
                std::cout << "Saved " << result->path << " (" << format_bytes(result->size) << ")";
                if (result->used_multipart) std::cout << " [multipart]";
                if (result->resumed) std::cout << " [resumed]";
                std::cout << std::endl;
            }
        }

        queue.shutdown();
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult info(const std::string& url, const core::Settings& settings) noexcept {
    try {
        core::Downloader downloader(settings.download, settings.output_dir);
        auto probed = downloader.probe(url, {});
        if (!probed) {
            std::cout << "Error: " << probed.error().message() << std::endl;
            return std::unexpected(probed.error());
        }

        std::cout << "URL: " << url << std::endl;
        std::cout << "Content-Length: "
                  << (probed->size > 0 ? format_bytes(probed->size) : std::string("unknown")) << std::endl;
        std::cout << "Accepts-Ranges: " << (probed->accepts_ranges ? "yes" : "no") << std::endl;
        std::cout << "Multipart: "
                  << (probed->accepts_ranges && probed->size >= settings.download.multipart_threshold ? "yes" : "no")
                  << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

void print_help(std::string_view program_name) {
    std::cout << "ferry " << ferry::version.to_string() << " - resilient queued downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "  " << program_name << " --worker < payload.json\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file (single URL)\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -n, --segments <N>      Parallel range fetchers per file\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "  -c, --config <FILE>     Load JSON settings\n";
    std::cout << "      --max-size <BYTES>  Refuse files larger than BYTES\n";
    std::cout << "      --skip-existing     Keep files that already exist\n";
    std::cout << "      --worker            Run one JSON job from stdin\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o myfile.zip https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -n 8 https://example.com/large.iso\n";
}

void print_version() {
    std::cout << "ferry " << ferry::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace ferry::cli
