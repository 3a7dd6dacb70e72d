// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/commands.hpp>
#include <spool/core/config.hpp>
#include <spool/core/log.hpp>
#include <spool/disk/file_blob_store.hpp>
#include <filesystem>
#include <iostream>

using namespace spool::cli;
using namespace spool::core;

namespace {

std::expected<Config, std::error_code> load_config(const CliArgs& args) {
    Config cfg;
    if (!args.config_file.empty()) {
        auto loaded = Config::load(args.config_file);
        if (!loaded) {
            std::cerr << "Error: cannot load " << args.config_file << ": "
                      << loaded.error().message() << std::endl;
            return std::unexpected(loaded.error());
        }
        cfg = *loaded;
    }

    if (!args.cache_dir.empty()) {
        cfg.storage.cache_dir = args.cache_dir;
    }
    if (cfg.storage.cache_dir.empty()) {
        cfg.storage.cache_dir = StorageConfig::default_cache_dir();
    }

    if (args.flush_threshold > 0 || args.no_incremental) {
        auto threshold = args.flush_threshold > 0 ? args.flush_threshold : cfg.caching.flush_threshold();
        auto caching = CachingConfig::create(threshold, !args.no_incremental && cfg.caching.incremental());
        if (!caching) {
            std::cerr << "Error: flush threshold must be at least " << MIN_FLUSH_THRESHOLD
                      << " bytes" << std::endl;
            return std::unexpected(caching.error());
        }
        cfg.caching = *caching;
    }
    return cfg;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }
    if (args.command.empty()) {
        print_help(argv[0]);
        return 2;
    }

    auto cfg = load_config(args);
    if (!cfg) return 2;

    set_log_level(cfg->log_level);
    if (args.verbose) set_log_level("debug");
    if (args.quiet) set_log_level("warn");

    const bool needs_url = args.command == "fetch" || args.command == "read" || args.command == "info";
    if (needs_url && args.url.empty()) {
        std::cerr << "Error: " << args.command << " needs a URL" << std::endl;
        return 2;
    }

    auto location = std::filesystem::path(cfg->storage.cache_dir) / cfg->storage.name;
    auto store = spool::disk::FileBlobStore::open(location);
    if (!store) {
        std::cerr << "Error: cannot open cache at " << location.string() << ": "
                  << store.error().message() << std::endl;
        return 1;
    }

    CacheService service(std::shared_ptr<spool::disk::BlobStore>(std::move(*store)), cfg->caching);

    CliResult result;
    if (args.command == "fetch") {
        result = spool::cli::fetch(service, args);
    } else if (args.command == "read") {
        result = spool::cli::read(service, args);
    } else if (args.command == "info") {
        result = spool::cli::info(service, args);
    } else if (args.command == "stats") {
        result = spool::cli::stats(service, location.string());
    } else if (args.command == "clear") {
        result = spool::cli::clear(service);
    } else {
        std::cerr << "Error: unknown command '" << args.command << "'" << std::endl;
        return 2;
    }

    return result ? *result : 1;
}
