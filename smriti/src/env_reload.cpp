// smriti-env-reload: Load every env of a federation and write it back
//
// Usage: smriti-env-reload [OPTIONS]
//
// Options:
//   --path DIR        Env directory (default: ~/.smriti)
//   --out DIR         Write to another directory instead of in place
//   --config FILE     JSON config (default: <path>/config.json)
//   --verbose         Show detailed progress
//
// Rewrites files in the current env format; exits non-zero if any env
// fails to load or to persist.

#include <smriti/smriti.hpp>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

using namespace smriti;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --path DIR        Env directory (default: ~/.smriti)\n"
              << "  --out DIR         Write to another directory instead of in place\n"
              << "  --config FILE     JSON config (default: <path>/config.json)\n"
              << "  --verbose, -v     Show detailed progress\n"
              << "  --help, -h        Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string base_dir = default_base_dir();
    std::string out_dir;
    std::string config_path;
    bool verbose_mode = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            base_dir = expand_home(argv[++i]);
        } else if (strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_dir = expand_home(argv[++i]);
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) config_path = base_dir + "/config.json";
    Config config = Config::load(config_path);
    config.base_dir = base_dir;
    // Writing happens below, once, after every env loaded
    config.save_on_exit = false;
    set_verbose(verbose_mode || config.verbose);

    if (!std::filesystem::exists(config.path_of(config.meta_file))) {
        std::cerr << "Error: no " << config.meta_file << " in " << base_dir << "\n";
        return 1;
    }

    try {
        EnvManager manager(config);
        std::cerr << "Loaded " << manager.meta()->env_count() << " envs from " << base_dir << "\n";

        std::string dir = out_dir.empty() ? base_dir : out_dir;
        manager.serialize_full(dir, config.serialize_blacklist);
        std::cerr << "Wrote envs to " << dir << "\n";
    } catch (const Error& e) {
        std::cerr << "Error: " << reify_error_kind(e.kind()) << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
