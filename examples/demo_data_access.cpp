/**
 * Duet Demo Data Access Application
 *
 * Interactive CLI exercising the Duet data-access layer against a local
 * document store and SQLite database.
 *
 * Usage:
 *   ./demo_data_access [options]
 *
 * Options:
 *   --documents <path>       Document store snapshot (default: :memory:)
 *   --sqlite <path>          SQLite database (default: :memory:)
 *   --default <backend>      Backend tried first: primary, secondary (default: primary)
 *   --graphql <url>          GraphQL endpoint for /gql (optional)
 *   --no-cache               Disable the record cache
 *   --log-level <level>      trace, debug, info, warn, error (default: info)
 *   --help                   Show this help message
 *
 * Unset options fall back to the DUET_* environment variables.
 */

#include "duet/duet.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct CLIArgs {
    std::optional<std::string> documents;
    std::optional<std::string> sqlite;
    std::optional<duet::BackendKind> default_backend;
    std::optional<std::string> graphql_url;
    bool no_cache = false;
    std::optional<std::string> log_level;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Duet Demo Data Access Application\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --documents <path>       Document store snapshot (default: :memory:)\n";
    std::cout << "  --sqlite <path>          SQLite database (default: :memory:)\n";
    std::cout << "  --default <backend>      Backend tried first: primary, secondary (default: primary)\n";
    std::cout << "  --graphql <url>          GraphQL endpoint for /gql (optional)\n";
    std::cout << "  --no-cache               Disable the record cache\n";
    std::cout << "  --log-level <level>      trace, debug, info, warn, error (default: info)\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " --sqlite notes.db --default secondary\n";
}

void print_commands() {
    std::cout << "\nAvailable commands:\n";
    std::cout << "  /list [query-json]       List notes, e.g. {\"filters\":[{\"column\":\"title\",\"op\":\"ilike\",\"value\":\"%a%\"}]}\n";
    std::cout << "  /get <id>                Fetch one note\n";
    std::cout << "  /create <json>           Create a note, e.g. {\"title\":\"hello\",\"body\":\"world\"}\n";
    std::cout << "  /update <id> <json>      Patch a note\n";
    std::cout << "  /delete <id>             Delete a note\n";
    std::cout << "  /count                   Count notes\n";
    std::cout << "  /raw <sql>               Run raw SQL on the secondary store\n";
    std::cout << "  /gql <query>             Run a GraphQL query through the result cache\n";
    std::cout << "  /stats                   Show record cache statistics\n";
    std::cout << "  /clear                   Clear the record cache\n";
    std::cout << "  /quit, /exit             Exit the application\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--documents" && i + 1 < argc) {
            args.documents = argv[++i];
        }
        else if (arg == "--sqlite" && i + 1 < argc) {
            args.sqlite = argv[++i];
        }
        else if (arg == "--default" && i + 1 < argc) {
            std::string kind = argv[++i];
            if (kind == "primary") {
                args.default_backend = duet::BackendKind::Primary;
            } else if (kind == "secondary") {
                args.default_backend = duet::BackendKind::Secondary;
            } else {
                std::cerr << "Unknown backend: " << kind << "\n";
                args.help = true;
                return args;
            }
        }
        else if (arg == "--graphql" && i + 1 < argc) {
            args.graphql_url = argv[++i];
        }
        else if (arg == "--no-cache") {
            args.no_cache = true;
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }
    return args;
}

duet::Config build_config(const CLIArgs& args) {
    duet::Config config;
    if (auto from_env = duet::Config::from_env()) {
        config = *from_env;
    }
    if (args.documents) config.document_store_path = *args.documents;
    if (args.sqlite) config.sqlite_path = *args.sqlite;
    if (!config.primary_configured() && !config.secondary_configured()) {
        config.document_store_path = std::string(duet::backend::DocumentBackend::kMemoryPath);
        config.sqlite_path = std::string(duet::backend::SqliteBackend::kMemoryPath);
    }
    if (args.default_backend) config.default_backend = *args.default_backend;
    if (args.graphql_url) config.query_cache.endpoint_url = *args.graphql_url;
    if (args.no_cache) config.cache.enabled = false;
    if (args.log_level) config.log_level = *args.log_level;
    return config;
}

duet::backend::TableHandle notes_table() {
    using duet::backend::Column;
    using duet::backend::ColumnType;
    return duet::backend::TableHandle{
        "notes",
        {
            Column{"id", ColumnType::Text, false},
            Column{"title", ColumnType::Text, false},
            Column{"body", ColumnType::Text, true},
            Column{"tags", ColumnType::Json, true},
            Column{"updated_at", ColumnType::Timestamp, true}
        },
        {"id"}
    };
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_result(const duet::Expected<nlohmann::json>& result) {
    if (!result) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return;
    }
    std::cout << result->dump(2) << "\n";
}

std::string rest_of(std::istringstream& in) {
    std::string rest;
    std::getline(in >> std::ws, rest);
    return rest;
}

} // namespace

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    duet::Config config = build_config(args);
    duet::log::init(duet::log::level_from_string(config.log_level));

    auto access_result = duet::DataAccess::create(config);
    if (!access_result) {
        std::cerr << "Error: " << access_result.error().to_string() << "\n";
        return 1;
    }
    auto access = std::move(*access_result);
    access->set_fallback_listener([](const duet::FallbackEvent& event) {
        std::cout << "[fallback] " << event.operation << ": "
                  << duet::backend_to_string(event.from_backend) << " -> "
                  << duet::backend_to_string(event.to_backend) << " (" << event.error_message << ")\n";
    });

    auto notes_result = access->collection(notes_table(), duet::CollectionOptions{
        [](const duet::Record& row) {
            duet::Record saved = row;
            saved["updated_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            return saved;
        },
        nullptr
    });
    if (!notes_result) {
        std::cerr << "Error: " << notes_result.error().to_string() << "\n";
        return 1;
    }
    auto notes = std::move(*notes_result);

    std::shared_ptr<duet::engine::QueryResultCache> query_cache;
    if (config.query_cache.endpoint_url) {
        auto origin = duet::origin::GraphQLOrigin::create(
            duet::origin::GraphQLOriginConfig{*config.query_cache.endpoint_url, config.query_cache.api_key});
        if (!origin) {
            std::cerr << "Error: " << origin.error().to_string() << "\n";
            return 1;
        }
        query_cache = std::make_shared<duet::engine::QueryResultCache>(
            access->backends().secondary, *origin,
            std::make_shared<duet::engine::InMemorySemanticStore>(), config.query_cache);
        if (auto ready = query_cache->initialize(); !ready) {
            std::cerr << "Error: " << ready.error().to_string() << "\n";
            return 1;
        }
    }

    print_separator();
    std::cout << "Duet Demo Data Access\n";
    print_separator();
    std::cout << "Primary: " << access->backends().primary->name() << "\n";
    std::cout << "Secondary: " << access->backends().secondary->name() << "\n";
    std::cout << "Default backend: " << duet::backend_to_string(config.default_backend) << "\n";
    std::cout << "Record cache: " << (config.cache.enabled ? "enabled" : "disabled") << "\n";
    std::cout << "GraphQL: " << config.query_cache.endpoint_url.value_or("(none)") << "\n";
    print_separator();
    std::cout << "Type '/help' for available commands.\n";

    std::string line;
    while (true) {
        std::cout << "\n> ";
        std::cout.flush();
        if (!std::getline(std::cin, line)) {
            break;
        }

        line.erase(0, line.find_first_not_of(" \t\n\r"));
        line.erase(line.find_last_not_of(" \t\n\r") + 1);
        if (line.empty()) {
            continue;
        }

        std::istringstream in(line);
        std::string command;
        in >> command;

        if (command == "/quit" || command == "/exit") {
            std::cout << "Goodbye!\n";
            break;
        }
        else if (command == "/help") {
            print_commands();
        }
        else if (command == "/list") {
            duet::QueryOptions query;
            const std::string text = rest_of(in);
            if (!text.empty()) {
                auto parsed = nlohmann::json::parse(text, nullptr, false);
                if (parsed.is_discarded()) {
                    std::cerr << "Invalid JSON\n";
                    continue;
                }
                auto options = duet::QueryOptions::from_json(parsed);
                if (!options) {
                    std::cerr << "Error: " << options.error().to_string() << "\n";
                    continue;
                }
                query = std::move(*options);
            }
            auto rows = notes.get_all(query);
            print_result(rows ? duet::Expected<nlohmann::json>(nlohmann::json(*rows))
                              : duet::Expected<nlohmann::json>(tl::unexpected(rows.error())));
        }
        else if (command == "/get") {
            std::string id;
            in >> id;
            auto row = notes.get_by_id(id);
            if (!row) {
                print_result(tl::unexpected(row.error()));
            } else {
                print_result(row->value_or(nlohmann::json(nullptr)));
            }
        }
        else if (command == "/create" || command == "/update") {
            std::string id;
            if (command == "/update") {
                in >> id;
            }
            auto data = nlohmann::json::parse(rest_of(in), nullptr, false);
            if (data.is_discarded() || !data.is_object()) {
                std::cerr << "Expected a JSON object\n";
                continue;
            }
            print_result(command == "/create" ? notes.create(data) : notes.update(id, data));
        }
        else if (command == "/delete") {
            std::string id;
            in >> id;
            auto removed = notes.remove(id);
            print_result(removed ? duet::Expected<nlohmann::json>(nlohmann::json(*removed))
                                 : duet::Expected<nlohmann::json>(tl::unexpected(removed.error())));
        }
        else if (command == "/count") {
            auto total = notes.count();
            print_result(total ? duet::Expected<nlohmann::json>(nlohmann::json(*total))
                               : duet::Expected<nlohmann::json>(tl::unexpected(total.error())));
        }
        else if (command == "/raw") {
            auto rows = access->execute_raw_query(rest_of(in));
            print_result(rows ? duet::Expected<nlohmann::json>(nlohmann::json(*rows))
                              : duet::Expected<nlohmann::json>(tl::unexpected(rows.error())));
        }
        else if (command == "/gql") {
            if (!query_cache) {
                std::cerr << "No GraphQL endpoint configured (use --graphql)\n";
                continue;
            }
            print_result(query_cache->execute(rest_of(in)).to_json());
        }
        else if (command == "/stats") {
            print_result(access->cache().stats().to_json());
            std::cout << "Fallbacks: " << access->fallback_count() << "\n";
        }
        else if (command == "/clear") {
            access->cache().clear();
            std::cout << "Record cache cleared.\n";
        }
        else {
            std::cout << "Unknown command: " << command << "\n";
            std::cout << "Type '/help' for available commands.\n";
        }
    }

    return 0;
}
