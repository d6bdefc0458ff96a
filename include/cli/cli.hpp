#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "cache/blob_cache.hpp"
#include "engine/chunked_asset_store.hpp"

namespace mvault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(engine::ChunkedAssetStore& assets, cache::BlobCache& blob_cache,
        unsigned int default_max_age_days = 30,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Executes a single command line. Returns false on "quit".
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    unsigned int default_max_age_days_;
    // System components
    engine::ChunkedAssetStore& assets_;
    cache::BlobCache& blob_cache_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_fetch_command(const std::string& url, const std::string& asset_id);
    void handle_stream_command(const std::string& url, const std::string& asset_id);
    void handle_get_command(const std::string& asset_id, const std::string& out_file);
    void handle_has_command(const std::string& asset_id);
    void handle_remove_command(const std::string& asset_id);
    void handle_list_command();
    void handle_gc_command();
    void handle_cache_command(const std::string& id, const std::string& file, const std::string& provider);
    void handle_cache_get_command(const std::string& id, const std::string& out_file);
    void handle_cache_list_command();
    void handle_cache_remove_command(const std::string& id);
    void handle_cache_stats_command();
    void handle_cache_cleanup_command(const std::vector<std::string>& args);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
    engine::ProgressCallback progress_printer();
    bool write_file(const std::string& path, const std::vector<uint8_t>& data);
};

} // namespace cli
} // namespace mvault
