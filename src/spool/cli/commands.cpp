// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/commands.hpp>
#include <spool/cli/progress_bar.hpp>
#include <spool/core/byte_format.hpp>
#include <spool/core/error.hpp>
#include <spool/core/http_session.hpp>
#include <spool/core/log.hpp>
#include <spool/version.hpp>
#include <algorithm>
#include <atomic>
#include <charconv>
#include <csignal>
#include <format>
#include <fstream>
#include <iostream>

using namespace spool::core;

namespace spool::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) {
    g_interrupted.store(true, std::memory_order_relaxed);
}

std::optional<std::int64_t> parse_int(std::string_view s) noexcept {
    std::int64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size() || value < 0) return std::nullopt;
    return value;
}

// Requested window, clamped to the resource
ByteRange resolve_range(const std::optional<ByteRange>& requested, std::int64_t content_length) {
    if (!requested) return {0, content_length};

    auto offset = std::min(requested->offset, content_length);
    auto end = requested->length > 0 ? std::min(requested->offset + requested->length, content_length)
                                     : content_length;
    return {offset, std::max<std::int64_t>(end - offset, 0)};
}

// Stream one gap into a write session. Returns the bytes received.
std::expected<std::int64_t, std::error_code>
fetch_gap(HttpSession& http, CacheCoordinator& coordinator, const std::string& url,
          const CachedRange& gap, ProgressBar* bar, std::int64_t& done) {
    auto session = coordinator.open_session(gap.offset);
    if (!session) {
        return std::unexpected(session.error());
    }

    std::int64_t received = 0;
    bool complete = false;

    auto on_body = [&](std::span<const std::byte> data) -> std::error_code {
        auto remaining = gap.length - received;
        auto take = std::min<std::int64_t>(remaining, static_cast<std::int64_t>(data.size()));
        if (take > 0) {
            if (auto ec = (*session)->append(data.first(static_cast<std::size_t>(take)))) {
                return ec;
            }
            received += take;
            done += take;
            if (bar) bar->update(done);
        }
        if (received >= gap.length && take < static_cast<std::int64_t>(data.size())) {
            // Server sent past the range; stop here
            complete = true;
            return make_error_code(CacheErrc::cancelled);
        }
        return {};
    };
    auto cancelled = [] { return g_interrupted.load(std::memory_order_relaxed); };

    auto response = http.fetch(url, gap.offset, gap.length, on_body, cancelled);

    if (!response && !complete) {
        if (response.error() == make_error_code(CacheErrc::cancelled)) {
            if (auto ec = (*session)->cancel()) {
                return std::unexpected(ec);
            }
        } else if (auto ec = (*session)->finish(response.error())) {
            return std::unexpected(ec);
        }
        return std::unexpected(response.error());
    }

    if (auto ec = (*session)->finish()) {
        return std::unexpected(ec);
    }
    return received;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

std::optional<ByteRange> parse_range(std::string_view text) noexcept {
    auto dash = text.find('-');
    if (dash == std::string_view::npos || dash == 0) return std::nullopt;

    auto start = parse_int(text.substr(0, dash));
    if (!start) return std::nullopt;

    auto rest = text.substr(dash + 1);
    if (rest.empty()) return ByteRange{*start, 0};

    auto end = parse_int(rest);
    if (!end || *end < *start) return std::nullopt;
    return ByteRange{*start, *end - *start + 1};
}

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto fail = [&](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::string_view {
            if (i + 1 < argc) return argv[++i];
            fail(std::format("{} needs a value", arg));
            return {};
        };

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
        } else if (arg == "-o" || arg == "--output") {
            args.output_file = next();
        } else if (arg == "-c" || arg == "--cache-dir") {
            args.cache_dir = next();
        } else if (arg == "--config") {
            args.config_file = next();
        } else if (arg == "--no-incremental") {
            args.no_incremental = true;
        } else if (arg == "-r" || arg == "--range") {
            auto value = next();
            args.range = parse_range(value);
            if (!args.range) fail(std::format("invalid range '{}'", value));
        } else if (arg == "-t" || arg == "--threshold") {
            auto value = next();
            auto parsed = parse_int(value);
            if (!parsed) {
                fail(std::format("invalid threshold '{}'", value));
            } else {
                args.flush_threshold = static_cast<std::uint64_t>(*parsed);
            }
        } else if (arg.starts_with("-")) {
            fail(std::format("unknown option '{}'", arg));
        } else if (args.command.empty()) {
            args.command = arg;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            fail(std::format("unexpected argument '{}'", arg));
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult fetch(CacheService& service, const CliArgs& args) noexcept {
    auto coordinator = service.coordinator_for_url(args.url);
    if (!coordinator) {
        std::cerr << "Error: Invalid URL: " << args.url << std::endl;
        return std::unexpected(coordinator.error());
    }

    HttpSession::global_init();
    HttpSession http;

    auto head = http.head(args.url);
    if (!head) {
        std::cerr << "Error: " << head.error().message() << std::endl;
        HttpSession::global_cleanup();
        return std::unexpected(head.error());
    }
    if (head->content_length <= 0) {
        std::cerr << "Error: server did not report a content length" << std::endl;
        HttpSession::global_cleanup();
        return std::unexpected(make_error_code(CacheErrc::no_content_info));
    }

    ContentInfo content{head->content_length, head->content_type, head->accepts_ranges};
    if (auto ec = (*coordinator)->save_content_info(content)) {
        std::cerr << "Error: " << ec.message() << std::endl;
        HttpSession::global_cleanup();
        return std::unexpected(ec);
    }

    auto window = resolve_range(args.range, content.content_length);
    auto gaps = (*coordinator)->gaps(window.offset, window.length);

    if (!content.byte_range_supported && (gaps.size() > 1 || (!gaps.empty() && gaps.front().offset > 0))) {
        logger()->warn("{} does not advertise range support", args.url);
    }

    std::int64_t missing = 0;
    for (const auto& gap : gaps) missing += gap.length;
    std::int64_t done = window.length - missing;

    if (!args.quiet) {
        std::cerr << std::format("{} [{}-{}] {} cached, {} to fetch in {} part(s)",
                                 args.url, window.offset, window.offset + window.length,
                                 format_bytes(done), format_bytes(missing), gaps.size())
                  << std::endl;
    }

    g_interrupted.store(false, std::memory_order_relaxed);
    auto previous = std::signal(SIGINT, on_interrupt);

    ProgressBar bar(window.length, "Fetching");
    ProgressBar* bar_ptr = args.quiet ? nullptr : &bar;
    if (bar_ptr) bar_ptr->update(done);

    std::error_code failure;
    for (const auto& gap : gaps) {
        auto received = fetch_gap(http, **coordinator, args.url, gap, bar_ptr, done);
        if (!received) {
            failure = received.error();
            break;
        }
    }

    std::signal(SIGINT, previous);
    HttpSession::global_cleanup();

    if (failure) {
        if (bar_ptr) bar_ptr->clear();
        if (failure == make_error_code(CacheErrc::cancelled)) {
            std::cerr << "Interrupted; " << format_bytes(done) << " kept in cache" << std::endl;
            return 130;
        }
        std::cerr << "Error: " << failure.message() << std::endl;
        return std::unexpected(failure);
    }

    if (bar_ptr) bar_ptr->finish();
    if (!args.quiet) {
        std::cout << std::format("{:.1f}% of {} cached", service.cache_percentage((*coordinator)->key()),
                                 format_bytes(content.content_length))
                  << std::endl;
    }
    return 0;
}

CliResult read(CacheService& service, const CliArgs& args) noexcept {
    if (!args.range) {
        std::cerr << "Error: read needs -r START-END" << std::endl;
        return std::unexpected(make_error_code(CacheErrc::invalid_range));
    }

    auto coordinator = service.coordinator_for_url(args.url);
    if (!coordinator) {
        std::cerr << "Error: Invalid URL: " << args.url << std::endl;
        return std::unexpected(coordinator.error());
    }

    auto window = *args.range;
    if (window.length == 0) {
        auto meta = (*coordinator)->retrieve_metadata();
        auto total = meta ? meta->content_info.content_length : 0;
        window = resolve_range(args.range, total);
    }

    auto result = (*coordinator)->retrieve_range(window.offset, window.length);

    std::cout << std::format("{}: {} bytes {}-{}", to_string(result.status), result.data.size(),
                             window.offset, window.offset + static_cast<std::int64_t>(result.data.size()))
              << std::endl;

    if (!args.output_file.empty() && !result.data.empty()) {
        std::ofstream out(args.output_file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(result.data.data()),
                  static_cast<std::streamsize>(result.data.size()));
        if (!out) {
            std::cerr << "Error: cannot write " << args.output_file << std::endl;
            return std::unexpected(make_error_code(disk::DiskErrc::write_error));
        }
    }

    return result.status == RetrieveStatus::Miss ? 1 : 0;
}

CliResult info(CacheService& service, const CliArgs& args) noexcept {
    auto coordinator = service.coordinator_for_url(args.url);
    if (!coordinator) {
        std::cerr << "Error: Invalid URL: " << args.url << std::endl;
        return std::unexpected(coordinator.error());
    }

    auto meta = (*coordinator)->retrieve_metadata();
    std::cout << "Key: " << (*coordinator)->key().str() << std::endl;
    if (!meta) {
        std::cout << "Not cached" << std::endl;
        return 1;
    }

    const auto& content = meta->content_info;
    std::cout << "Content-Type: " << content.content_type << std::endl;
    std::cout << "Content-Length: " << content.content_length
              << " (" << format_bytes(content.content_length) << ")" << std::endl;
    std::cout << "Accepts-Ranges: " << (content.byte_range_supported ? "yes" : "no") << std::endl;
    std::cout << std::format("Cached: {} ({:.2f}%){}", format_bytes(meta->cached_bytes()),
                             meta->percent_cached(),
                             meta->percent_cached() >= FULLY_CACHED_PERCENT ? ", complete" : "")
              << std::endl;
    std::cout << "Chunks: " << meta->chunks.size() << std::endl;
    for (const auto& r : meta->cached_ranges.ranges()) {
        std::cout << std::format("  {}-{} ({})", r.offset, r.end() - 1, format_bytes(r.length))
                  << std::endl;
    }
    return 0;
}

CliResult stats(CacheService& service, std::string_view location) noexcept {
    std::cout << "Cache: " << location << std::endl;
    std::cout << "Size: " << format_bytes(static_cast<std::int64_t>(service.total_size())) << std::endl;
    std::cout << std::format("Flush threshold: {}{}",
                             format_bytes(static_cast<std::int64_t>(service.config().flush_threshold())),
                             service.config().incremental() ? "" : " (incremental off)")
              << std::endl;
    return 0;
}

CliResult clear(CacheService& service) noexcept {
    auto before = service.total_size();
    if (auto ec = service.clear()) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }
    std::cout << "Removed " << format_bytes(static_cast<std::int64_t>(before)) << std::endl;
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "spool " << spool::version.to_string() << " - progressive range cache for media\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " <COMMAND> [OPTIONS] [URL]\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  fetch <URL>             Download the parts of a range not yet cached\n";
    std::cout << "  read <URL>              Serve a range from the cache (needs -r)\n";
    std::cout << "  info <URL>              Show what is cached for a resource\n";
    std::cout << "  stats                   Show cache size and settings\n";
    std::cout << "  clear                   Remove everything from the cache\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -r, --range START-END   Byte range, inclusive (START- for to the end)\n";
    std::cout << "  -t, --threshold BYTES   Flush every BYTES received (min 262144)\n";
    std::cout << "      --no-incremental    Only persist when a transfer ends\n";
    std::cout << "  -o, --output <FILE>     Write read bytes to FILE\n";
    std::cout << "  -c, --cache-dir <DIR>   Cache directory\n";
    std::cout << "      --config <FILE>     JSON configuration file\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " fetch https://example.com/movie.mp4\n";
    std::cout << "  " << program_name << " fetch -r 0-1048575 https://example.com/movie.mp4\n";
    std::cout << "  " << program_name << " read -r 0-1023 -o head.bin https://example.com/movie.mp4\n";
}

void print_version() noexcept {
    std::cout << "spool " << spool::version.to_string() << std::endl;
    std::cout << "Metadata format " << METADATA_FORMAT_VERSION << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace spool::cli
