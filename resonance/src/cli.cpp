// resonance: command-line front end for the matching engine
//
// Usage: resonance <command> [options]
//
// Commands:
//   match <query>     Rank profiles against a query
//   build             Encode profiles and write an index snapshot
//   explain <query>   Per-field resonance of one profile
//   stats             Show index statistics
//   help              Show this help

#include <resonance/resonance.hpp>

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace resonance;

static const char* prog_name(const char* argv0) {
    const char* slash = std::strrchr(argv0, '/');
    return slash ? slash + 1 : argv0;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "resonance " << RESONANCE_VERSION << " - hyperdimensional profile matching\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  match <query>      Rank profiles against a query\n"
              << "  build              Encode --profiles and write --index\n"
              << "  explain <query>    Per-field similarity for --id (needs --profiles)\n"
              << "  stats              Show index statistics\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --profiles FILE    Agent profiles (JSON array or object keyed by id)\n"
              << "  --index FILE       Index snapshot to read (match, stats) or write (build)\n"
              << "  --config FILE      JSON engine config\n"
              << "  --k N              Results to return (default: config, 10)\n"
              << "  --threshold T      Only return similarity >= T (thresholded top-k)\n"
              << "  --id ID            Profile for explain\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable debug logging\n"
              << "  -v, --version      Show version\n"
#ifdef RESONANCE_WITH_ONNX
              << "  --model PATH       ONNX sentence-transformer model\n"
              << "  --vocab PATH       WordPiece vocabulary for --model\n"
#endif
              ;
}

static std::shared_ptr<EmbeddingProvider> make_provider(EngineConfig& config,
                                                        const std::string& model_path,
                                                        const std::string& vocab_path) {
#ifdef RESONANCE_WITH_ONNX
    if (!model_path.empty()) {
        if (vocab_path.empty()) throw ConfigError("--model needs --vocab");
        auto provider = create_onnx_provider(model_path, vocab_path);
        config.embed_dim = provider->dimension();
        return provider;
    }
#else
    if (!model_path.empty() || !vocab_path.empty()) {
        throw ConfigError("built without ONNX support; --model/--vocab unavailable");
    }
#endif
    HashingConfig hashing;
    hashing.dimension = config.embed_dim;
    return std::make_shared<CachingEmbeddingProvider>(
        std::make_shared<HashingEmbeddingProvider>(hashing));
}

static void print_results(const std::string& query, const std::vector<MatchResult>& results,
                          bool json_output) {
    if (json_output) {
        json out = json::array();
        for (size_t i = 0; i < results.size(); ++i) {
            out.push_back({
                {"rank", i + 1},
                {"id", results[i].entity_id},
                {"similarity", results[i].similarity},
                {"distance", results[i].distance},
            });
        }
        std::cout << out.dump(2) << "\n";
        return;
    }

    if (results.empty()) {
        std::cout << "No matches for: " << query << "\n";
        return;
    }
    std::cout << "Matches for: " << query << "\n";
    std::cout << "═══════════════════════════════\n";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        std::cout << "[" << (i + 1) << "] " << std::left << std::setw(24) << r.entity_id
                  << " " << std::fixed << std::setprecision(4) << r.similarity
                  << "  (hamming " << r.distance << ")\n";
    }
}

int cmd_match(ResonanceEngine& engine, const std::string& query,
              const MatchPolicy& policy, bool json_output) {
    if (query.empty()) {
        std::cerr << "Usage: resonance match <query> (--profiles FILE | --index FILE)\n";
        return 1;
    }
    print_results(query, engine.match(query, policy), json_output);
    return 0;
}

int cmd_build(ResonanceEngine& engine, const std::string& index_path) {
    engine.save(index_path);
    auto s = engine.stats();
    std::cout << "Wrote " << s.entities << " entities to " << index_path << "\n";
    return 0;
}

int cmd_explain(ResonanceEngine& engine, const std::string& id, const std::string& query,
                bool json_output) {
    if (id.empty() || query.empty()) {
        std::cerr << "Usage: resonance explain <query> --id ID --profiles FILE\n";
        return 1;
    }
    auto fields = engine.explain(id, query);

    if (json_output) {
        json out = json::array();
        for (const auto& f : fields) {
            out.push_back({{"field", f.field_tag}, {"similarity", f.similarity},
                           {"distance", f.distance}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Resonance of " << id << " with: " << query << "\n";
    std::cout << "═══════════════════════════════\n";
    for (const auto& f : fields) {
        std::cout << "  " << std::left << std::setw(16) << f.field_tag << " "
                  << std::fixed << std::setprecision(4) << f.similarity << "\n";
    }
    return 0;
}

int cmd_stats(ResonanceEngine& engine, bool json_output) {
    auto s = engine.stats();
    if (json_output) {
        json out = {
            {"entities", s.entities},
            {"bits", s.bits},
            {"words_per_vector", s.words_per_vector},
            {"memory_bytes", s.memory_bytes},
            {"index_version", s.index_version},
            {"seed", s.seed},
            {"dense_dim", s.dense_dim},
            {"model", s.model_id},
            {"encodes_in_flight", s.encodes_in_flight},
            {"config", config_to_json(engine.config())},
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Index Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Entities:     " << s.entities << "\n";
    std::cout << "Width:        " << s.bits << " bits (" << s.words_per_vector << " words)\n";
    std::cout << "Memory:       " << s.memory_bytes / 1024 << " KiB\n";
    std::cout << "Version:      " << s.index_version << "\n";
    std::cout << "Seed:         " << s.seed << "\n";
    std::cout << "Dense dim:    " << s.dense_dim << "\n";
    std::cout << "Model:        " << s.model_id << "\n";
    std::cout << "Policy:       " << match_mode_name(engine.config().default_policy.mode)
              << " k=" << engine.config().default_policy.k;
    if (engine.config().default_policy.mode == MatchMode::Thresholded) {
        std::cout << " threshold=" << engine.config().default_policy.threshold;
    }
    std::cout << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string query;
    std::string profiles_path;
    std::string index_path;
    std::string config_path;
    std::string entity_id;
    std::string model_path;
    std::string vocab_path;
    long k = -1;
    float threshold = 0.0f;
    bool threshold_set = false;
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--profiles") == 0 && i + 1 < argc) {
            profiles_path = argv[++i];
        } else if (strcmp(argv[i], "--index") == 0 && i + 1 < argc) {
            index_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--id") == 0 && i + 1 < argc) {
            entity_id = argv[++i];
        } else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_path = argv[++i];
        } else if (strcmp(argv[i], "--vocab") == 0 && i + 1 < argc) {
            vocab_path = argv[++i];
        } else if (strcmp(argv[i], "--k") == 0 && i + 1 < argc) {
            char* end = nullptr;
            k = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || k < 0) {
                std::cerr << "Error: --k expects a non-negative integer\n";
                return 1;
            }
        } else if (strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
            char* end = nullptr;
            const char* arg = argv[++i];
            threshold = std::strtof(arg, &end);
            if (end == arg || *end != '\0') {
                std::cerr << "Error: --threshold expects a number\n";
                return 1;
            }
            threshold_set = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            log::set_verbose(true);
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "resonance " << RESONANCE_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if ((command == "match" || command == "explain") && query.empty()) {
                query = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command != "match" && command != "build" && command != "explain" && command != "stats") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        EngineConfig config;
        if (!config_path.empty()) config = load_config(config_path);
        apply_env_overrides(config);

        MatchPolicy policy = policy_with_overrides(config.default_policy, k >= 0,
                                                   static_cast<size_t>(k >= 0 ? k : 0),
                                                   threshold_set, threshold);

        auto provider = make_provider(config, model_path, vocab_path);
        ResonanceEngine engine(provider, config);

        if (command == "build") {
            if (profiles_path.empty() || index_path.empty()) {
                std::cerr << "Usage: resonance build --profiles FILE --index FILE\n";
                return 1;
            }
            engine.register_profiles(load_profiles(profiles_path));
            return cmd_build(engine, index_path);
        }

        if (command == "explain") {
            if (profiles_path.empty()) {
                std::cerr << "Error: explain needs --profiles (snapshots keep no per-field vectors)\n";
                return 1;
            }
            engine.register_profiles(load_profiles(profiles_path));
            return cmd_explain(engine, entity_id, query, json_output);
        }

        if (!index_path.empty()) {
            engine.load(index_path);
        } else if (!profiles_path.empty()) {
            engine.register_profiles(load_profiles(profiles_path));
        } else {
            std::cerr << "Error: need --profiles FILE or --index FILE\n";
            return 1;
        }

        if (command == "stats") {
            return cmd_stats(engine, json_output);
        }
        return cmd_match(engine, query, policy, json_output);

    } catch (const ResonanceError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
