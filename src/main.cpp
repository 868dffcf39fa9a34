#include "config.hpp"
#include "context.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "memory/node_json.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <atomic>
#include <csignal>
#include <mutex>
#include <optional>
#include <vector>

using json = nlohmann::json;

static std::atomic<bool> g_cancel{false};

static void signal_handler(int /*sig*/) {
    g_cancel.store(true);
}

static void print_usage() {
    std::cout << "Usage: memweave [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  add TEXT             Check a fact against memory and store it\n"
              << "  search QUERY         Retrieve the facts most relevant to a query\n"
              << "  parse QUERY          Show the retrieval plan for a query\n"
              << "  link NODE_ID         Mine relations, inferences and aggregates around a node\n"
              << "  export [FILE]        Dump the namespace as JSON (stdout when no file)\n"
              << "  import FILE          Load a namespace dump\n"
              << "  compare SOURCE T...  Classify SOURCE against each target with the NLI backend\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.memweave/config.json)\n"
              << "  -n, --namespace NS   Namespace (default from config)\n"
              << "  --provider NAME      LLM provider (openai, ollama)\n"
              << "  --model NAME         LLM model\n"
              << "  -k, --top-k N        Number of results / neighbors\n"
              << "  --mode fast|fine     Goal parsing mode\n"
              << "  --type TYPE          Memory type (WorkingMemory, LongTermMemory, UserMemory, OuterMemory)\n"
              << "  --role ROLE          Speaker of an added fact (user, assistant)\n"
              << "  --lang LANG          Language of an added fact (en, zh; detected when absent)\n"
              << "  --key KEY            Topic key of an added fact\n"
              << "  --tag TAG            Tag of an added fact (repeatable)\n"
              << "  --link               After add, run relation mining on the new node\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for OpenAI\n"
              << "  OPENAI_BASE_URL      Base URL for OpenAI-compatible servers\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434)\n"
              << "  MEMWEAVE_STORE_PATH  Store file\n"
              << "  MEMWEAVE_NLI_URL     NLI service base URL\n"
              << "  MEMWEAVE_LLM_PROVIDER, MEMWEAVE_LLM_MODEL\n";
}

struct Options {
    std::string config_path;
    std::string ns;
    std::string provider;
    std::string model;
    std::string mode;
    std::string type;
    std::string role;
    std::string lang;
    std::string key;
    std::vector<std::string> tags;
    uint32_t top_k = 0;
    bool link = false;
    std::vector<std::string> args;   // command followed by its arguments
};

static json nodes_json(const std::vector<memweave::MemoryNode>& nodes) {
    json out = json::array();
    for (const auto& node : nodes) {
        auto item = memweave::node_to_json(node, false);
        item["score"] = node.score;
        out.push_back(std::move(item));
    }
    return out;
}

static json edges_json(const std::vector<memweave::MemoryEdge>& edges) {
    json out = json::array();
    for (const auto& e : edges) out.push_back(memweave::edge_to_json(e));
    return out;
}

static json reasoning_json(const memweave::ReasoningResult& r) {
    return {
        {"status", memweave::reasoning_status_to_string(r.status)},
        {"relations", edges_json(r.relations)},
        {"sequence_links", edges_json(r.sequence_links)},
        {"inferred_nodes", nodes_json(r.inferred_nodes)},
        {"aggregate_nodes", nodes_json(r.aggregate_nodes)},
        {"failures", r.failures},
        {"errors", r.errors}
    };
}

static memweave::GoalMode resolve_mode(const Options& opts, const memweave::Config& config) {
    std::string name = opts.mode.empty() ? config.llm.goal_mode : opts.mode;
    auto mode = memweave::goal_mode_from_string(name);
    if (!mode) throw std::invalid_argument("Unknown goal mode: " + name);
    return *mode;
}

static std::optional<memweave::MemoryType> resolve_type(const Options& opts) {
    if (opts.type.empty()) return std::nullopt;
    auto type = memweave::memory_type_from_string(opts.type);
    if (!type) throw std::invalid_argument("Unknown memory type: " + opts.type);
    return type;
}

static int cmd_add(memweave::CoreContext& ctx, const Options& opts, const std::string& ns) {
    if (opts.args.size() < 2) {
        std::cerr << "add: missing TEXT\n";
        return 1;
    }
    memweave::MemoryNode candidate;
    candidate.text = opts.args[1];
    candidate.key = opts.key;
    candidate.tags.insert(opts.tags.begin(), opts.tags.end());
    if (auto type = resolve_type(opts)) candidate.memory_type = *type;
    if (!opts.role.empty()) {
        memweave::SourceRef src;
        src.type = "chat";
        src.role = opts.role;
        src.lang = opts.lang;
        src.content = candidate.text;
        candidate.sources.push_back(std::move(src));
    }

    auto result = memweave::add_memory(ctx, candidate, ns);
    json out = {
        {"status", memweave::commit_status_to_string(result.status)},
        {"node_id", result.node_id},
        {"existing_id", result.existing_id},
        {"degraded", result.degraded},
        {"error", memweave::error_kind_to_string(result.error)},
        {"message", result.message}
    };

    bool written = result.status == memweave::CommitStatus::Committed ||
                   result.status == memweave::CommitStatus::Flagged;
    if (opts.link && written) {
        auto node = ctx.store->get_node(result.node_id, ns);
        if (node) {
            std::lock_guard<std::mutex> lock(ctx.locks.for_namespace(ns));
            auto r = ctx.engine->process_node(*node, {}, opts.top_k, ns, &g_cancel);
            out["reasoning"] = reasoning_json(r);
        }
    }
    std::cout << out.dump(2) << "\n";
    return result.status == memweave::CommitStatus::Rejected ? 1 : 0;
}

static int cmd_search(memweave::CoreContext& ctx, const Options& opts, const std::string& ns) {
    if (opts.args.size() < 2) {
        std::cerr << "search: missing QUERY\n";
        return 1;
    }
    auto result = memweave::search_memories(ctx, opts.args[1], resolve_mode(opts, ctx.config),
                                            ns, opts.top_k, resolve_type(opts), &g_cancel);
    json out = {
        {"status", memweave::retrieval_status_to_string(result.status)},
        {"nodes", nodes_json(result.nodes)},
        {"errors", result.errors}
    };
    std::cout << out.dump(2) << "\n";
    return result.status == memweave::RetrievalStatus::Unavailable ? 1 : 0;
}

static int cmd_parse(memweave::CoreContext& ctx, const Options& opts) {
    if (opts.args.size() < 2) {
        std::cerr << "parse: missing QUERY\n";
        return 1;
    }
    auto goal = ctx.goal_parser->parse(opts.args[1], resolve_mode(opts, ctx.config));
    json out = {
        {"memories", goal.memories},
        {"keys", goal.keys},
        {"tags", goal.tags},
        {"goal_type", memweave::goal_type_to_string(goal.goal_type)},
        {"fallback", goal.fallback}
    };
    std::cout << out.dump(2) << "\n";
    return 0;
}

static int cmd_link(memweave::CoreContext& ctx, const Options& opts, const std::string& ns) {
    if (opts.args.size() < 2) {
        std::cerr << "link: missing NODE_ID\n";
        return 1;
    }
    auto node = ctx.store->get_node(opts.args[1], ns);
    if (!node) {
        std::cerr << "link: no node " << opts.args[1] << " in namespace " << ns << "\n";
        return 1;
    }
    std::lock_guard<std::mutex> lock(ctx.locks.for_namespace(ns));
    auto result = ctx.engine->process_node(*node, {}, opts.top_k, ns, &g_cancel);
    std::cout << reasoning_json(result).dump(2) << "\n";
    return result.status == memweave::ReasoningStatus::Failed ? 1 : 0;
}

static int cmd_export(memweave::CoreContext& ctx, const Options& opts, const std::string& ns) {
    std::string dump = ctx.store->snapshot_export(ns);
    if (opts.args.size() < 2) {
        std::cout << dump << "\n";
        return 0;
    }
    if (!memweave::atomic_write_file(opts.args[1], dump)) {
        std::cerr << "export: cannot write " << opts.args[1] << "\n";
        return 1;
    }
    std::cerr << "Exported namespace " << ns << " to " << opts.args[1] << "\n";
    return 0;
}

static int cmd_import(memweave::CoreContext& ctx, const Options& opts, const std::string& ns) {
    if (opts.args.size() < 2) {
        std::cerr << "import: missing FILE\n";
        return 1;
    }
    std::string dump = memweave::read_file(opts.args[1]);
    if (dump.empty()) {
        std::cerr << "import: cannot read " << opts.args[1] << "\n";
        return 1;
    }
    std::lock_guard<std::mutex> lock(ctx.locks.for_namespace(ns));
    uint32_t imported = ctx.store->snapshot_import(dump, ns);
    std::cout << "Imported " << imported << " nodes into namespace " << ns << "\n";
    return 0;
}

static int cmd_compare(memweave::CoreContext& ctx, const Options& opts) {
    if (opts.args.size() < 2) {
        std::cerr << "compare: missing SOURCE\n";
        return 1;
    }
    std::vector<std::string> targets(opts.args.begin() + 2, opts.args.end());
    auto batch = ctx.nli->compare_one_to_many(opts.args[1], targets);
    json labels = json::array();
    for (auto r : batch.results) labels.push_back(memweave::nli_result_to_string(r));
    json out = {
        {"results", labels},
        {"error", memweave::error_kind_to_string(batch.error)}
    };
    std::cout << out.dump(2) << "\n";
    return batch.ok() ? 0 : 1;
}

static bool parse_uint(const char* s, uint32_t& out) {
    char* end = nullptr;
    unsigned long v = std::strtoul(s, &end, 10);
    if (end == s || *end != '\0') return false;
    out = static_cast<uint32_t>(v);
    return true;
}

int main(int argc, char* argv[]) try {
    Options opts;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-n") == 0 || std::strcmp(argv[i], "--namespace") == 0) && i + 1 < argc) {
            opts.ns = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            opts.provider = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            opts.model = argv[++i];
        } else if ((std::strcmp(argv[i], "-k") == 0 || std::strcmp(argv[i], "--top-k") == 0) && i + 1 < argc) {
            if (!parse_uint(argv[++i], opts.top_k)) {
                std::cerr << "Invalid --top-k: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            opts.mode = argv[++i];
        } else if (std::strcmp(argv[i], "--type") == 0 && i + 1 < argc) {
            opts.type = argv[++i];
        } else if (std::strcmp(argv[i], "--role") == 0 && i + 1 < argc) {
            opts.role = argv[++i];
        } else if (std::strcmp(argv[i], "--lang") == 0 && i + 1 < argc) {
            opts.lang = argv[++i];
        } else if (std::strcmp(argv[i], "--key") == 0 && i + 1 < argc) {
            opts.key = argv[++i];
        } else if (std::strcmp(argv[i], "--tag") == 0 && i + 1 < argc) {
            opts.tags.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--link") == 0) {
            opts.link = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0' && opts.args.empty()) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            opts.args.push_back(argv[i]);
        }
    }
    if (opts.args.empty()) {
        print_usage();
        return 1;
    }
    const std::string& command = opts.args[0];

    memweave::CurlGlobal curl_global;
    auto config = opts.config_path.empty() ? memweave::Config::load()
                                           : memweave::Config::load_from(opts.config_path, false);
    if (!opts.provider.empty()) config.llm.provider = opts.provider;
    if (!opts.model.empty()) config.llm.model = opts.model;
    std::string ns = opts.ns.empty() ? config.store.default_namespace : opts.ns;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    memweave::CurlHttpClient http_client(&g_cancel);
    auto registry = memweave::BackendRegistry::with_builtins();
    std::unique_ptr<memweave::CoreContext> ctx;
    try {
        ctx = memweave::create_context(config, registry, http_client);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    int rc;
    if (command == "add") {
        rc = cmd_add(*ctx, opts, ns);
    } else if (command == "search") {
        rc = cmd_search(*ctx, opts, ns);
    } else if (command == "parse") {
        rc = cmd_parse(*ctx, opts);
    } else if (command == "link") {
        rc = cmd_link(*ctx, opts, ns);
    } else if (command == "export") {
        rc = cmd_export(*ctx, opts, ns);
    } else if (command == "import") {
        rc = cmd_import(*ctx, opts, ns);
    } else if (command == "compare") {
        rc = cmd_compare(*ctx, opts);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        rc = 1;
    }

    ctx.reset();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
