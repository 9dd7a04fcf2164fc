// smriti: Command-line front-end for the environment federation
//
// Usage: smriti <command> [options]
//
// Commands:
//   repl       Interactive read-eval-print loop (default)
//   eval       Evaluate an expression
//   run        Evaluate every form in a file
//   stats      Show env, node and triple counts
//   help       Show this help

#include <smriti/smriti.hpp>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace smriti;

static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "smriti " << SMRITI_VERSION << " - Persistent semantic environment\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  repl               Interactive loop on stdin (default)\n"
              << "  eval <expr>        Evaluate an expression and print its value\n"
              << "  run <file>         Evaluate every form in a file\n"
              << "  stats              Show env, node and triple counts\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --path DIR         Env directory (default: ~/.smriti)\n"
              << "  --config FILE      JSON config (default: <path>/config.json)\n"
              << "  --reset            Discard the stored envs and bootstrap afresh\n"
              << "  --no-save          Do not write envs back on exit\n"
              << "  --json             Output stats as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

void print_error(const Agent& agent, const Error& err) {
    std::cout << "[ERROR] ";
    agent.print_sexp(std::cout, err.reify());
    std::cout << "\n";
    agent.trace_error(std::cout, err);
}

void print_result(const Agent& agent, const Sexp& result) {
    std::cout << "-> ";
    agent.print_sexp(std::cout, result);
    std::cout << "\n";
}

int cmd_repl(Session& session) {
    Agent& agent = session.agent();
    Tokenizer tokenizer;
    Parser parser;
    std::string line;

    std::cout << "smriti " << SMRITI_VERSION << " (working env "
              << agent.pos().env.to_string() << ")\n";
    while (true) {
        std::cout << (parser.idle() && !tokenizer.in_string() ? "> " : ". ") << std::flush;
        if (!std::getline(std::cin, line)) break;

        try {
            tokenizer.feed_line(line);
            while (tokenizer.ready()) parser.feed(tokenizer.pop());
            while (parser.ready()) {
                Sexp form = parser.pop();
                print_result(agent, session.evaluate(form));
            }
        } catch (const Error& e) {
            print_error(agent, e);
            // Drop the rest of the broken input
            tokenizer.clear();
            parser.reset();
        }
    }
    std::cout << "\n";
    return 0;
}

int cmd_eval(Session& session, const std::string& expr) {
    try {
        print_result(session.agent(), session.run_text(expr));
        return 0;
    } catch (const Error& e) {
        print_error(session.agent(), e);
        return 1;
    }
}

int cmd_run(Session& session, const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        std::cerr << "Error: cannot open " << file << "\n";
        return 1;
    }
    try {
        parse_stream_each(in, [&session](Sexp form) { session.evaluate(form); });
        return 0;
    } catch (const Error& e) {
        print_error(session.agent(), e);
        return 1;
    }
}

json stats_json(Session& session) {
    MetaEnv& meta = *session.manager().meta();
    json envs = json::array();
    for (const auto& [env_node, path] : session.manager().serialized_envs()) {
        const Environment* env = meta.env(env_node);
        if (!env) continue;
        envs.push_back({{"env", env_node.id},
                        {"path", path},
                        {"nodes", env->node_count()},
                        {"triples", env->triple_count()}});
    }
    return json{
        {"version", SMRITI_VERSION},
        {"env_format", version::env_format()},
        {"base_dir", session.manager().config().base_dir},
        {"meta", {{"nodes", meta.base().node_count()}, {"triples", meta.base().triple_count()}}},
        {"env_count", meta.env_count()},
        {"envs", envs},
    };
}

int cmd_stats(Session& session, bool json_output) {
    json stats = stats_json(session);
    if (json_output) {
        std::cout << stats.dump() << "\n";
        return 0;
    }
    std::cout << "smriti " << SMRITI_VERSION << " (env format " << version::env_format() << ")\n"
              << "Base dir:  " << stats["base_dir"].get<std::string>() << "\n"
              << "Meta env:  " << stats["meta"]["nodes"].get<size_t>() << " nodes, "
              << stats["meta"]["triples"].get<size_t>() << " triples\n"
              << "Envs:      " << stats["env_count"].get<size_t>() << "\n";
    for (const auto& e : stats["envs"]) {
        std::cout << "  ^" << e["env"].get<uint64_t>() << "  " << e["path"].get<std::string>()
                  << ": " << e["nodes"].get<size_t>() << " nodes, "
                  << e["triples"].get<size_t>() << " triples\n";
    }
    return 0;
}

// Remove the env files a config names so the next load bootstraps afresh
void reset_envs(const Config& config) {
    for (const auto& f : {config.meta_file, config.lang_file, config.history_file,
                          config.impl_file, config.working_file}) {
        std::error_code ec;
        if (std::filesystem::remove(config.path_of(f), ec)) {
            std::cerr << "[cli] Removed " << config.path_of(f) << "\n";
        } else if (ec) {
            std::cerr << "[cli] Could not remove " << config.path_of(f) << ": " << ec.message() << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    std::string base_dir;
    std::string config_path;
    std::string command;
    std::string argument;
    bool reset = false;
    bool no_save = false;
    bool json_output = false;
    bool verbose_mode = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            base_dir = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--reset") == 0) {
            reset = true;
        } else if (strcmp(argv[i], "--no-save") == 0) {
            no_save = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "smriti " << SMRITI_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-' || strcmp(argv[i], "-") == 0) {
            if (command.empty()) {
                command = argv[i];
            } else if ((command == "eval" || command == "run") && argument.empty()) {
                argument = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) command = "repl";
    if (command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command != "repl" && command != "eval" && command != "run" && command != "stats") {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if ((command == "eval" || command == "run") && argument.empty()) {
        std::cerr << "Usage: smriti " << command << (command == "eval" ? " <expr>\n" : " <file>\n");
        return 1;
    }

    std::string dir = base_dir.empty() ? default_base_dir() : expand_home(base_dir);
    if (config_path.empty()) config_path = dir + "/config.json";
    Config config = Config::load(config_path);
    if (!base_dir.empty() || config.base_dir == default_base_dir()) config.base_dir = dir;
    if (no_save) config.save_on_exit = false;
    if (verbose_mode) config.verbose = true;
    set_verbose(config.verbose);

    if (reset) reset_envs(config);

    int result = 0;
    try {
        Session session(config);
        if (command == "repl") {
            result = cmd_repl(session);
        } else if (command == "eval") {
            result = cmd_eval(session, argument);
        } else if (command == "run") {
            result = cmd_run(session, argument);
        } else {
            result = cmd_stats(session, json_output);
        }
        if (config.save_on_exit) session.save();
    } catch (const Error& e) {
        std::cerr << "[cli] " << reify_error_kind(e.kind()) << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[cli] " << e.what() << "\n";
        return 1;
    }
    return result;
}
