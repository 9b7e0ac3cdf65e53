// Collab MCP Server
// Model Context Protocol server exposing @collab trust lookups
//
// Usage:
//   collab_mcp [options]
//
// Options:
//   --collab-dir PATH   Configuration directory (default: $COLLAB_DIR or .collab)
//   --verbose           Debug logging on stderr

#include <collab/mcp/handler.hpp>
#include <collab/version.hpp>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

void signal_handler(int sig) {
    (void)sig;
    std::_Exit(0);
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --collab-dir PATH   Configuration directory (default: .collab)\n"
              << "  --verbose           Enable verbose debug logging\n"
              << "  --help              Show this help message\n"
              << "\n"
              << "Reads JSON-RPC requests from stdin, one per line.\n";
}

int main(int argc, char* argv[]) {
    bool verbose_mode = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--collab-dir") == 0 && i + 1 < argc) {
            setenv("COLLAB_DIR", argv[++i], 1);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    collab::Workspace workspace;
    std::string error;
    if (!workspace.load(error)) {
        std::cerr << "[collab_mcp] Error: " << error << "\n";
        return 1;
    }
    if (verbose_mode) collab::set_verbose(true);

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    collab::mcp::Handler handler(&workspace);
    std::cerr << "[collab_mcp] collab " << COLLAB_VERSION << ", "
              << handler.tools().size() << " tools, config " << collab::collab_dir() << "\n";
    std::cerr << "[collab_mcp] Listening on stdin...\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;

        auto response = handler.handle(line);
        if (response) {
            std::cout << *response << "\n";
            std::cout.flush();
        }
        if (handler.shutdown_requested()) break;
    }

    std::cerr << "[collab_mcp] Shutdown complete (cache: " << workspace.cache().hits()
              << " hits, " << workspace.cache().misses() << " misses)\n";
    return 0;
}
