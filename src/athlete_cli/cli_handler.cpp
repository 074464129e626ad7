#include "athlete_cli/cli_handler.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "athlete_core/db/source_document_repo.hpp"
#include "athlete_core/services/index_maintenance_service.hpp"
#include "athlete_core/services/indexing_pipeline.hpp"
#include "athlete_core/services/retrieval_service.hpp"

namespace athlete_cli {

namespace {

Command command_from_string(const std::string& command) {
    if (command == "import" || command == "i") return Command::Import;
    if (command == "index" || command == "x") return Command::Index;
    if (command == "batch" || command == "b") return Command::Batch;
    if (command == "search" || command == "s") return Command::Search;
    if (command == "stats") return Command::Stats;
    if (command == "delete") return Command::Delete;
    if (command == "rebuild") return Command::Rebuild;
    if (command == "clear") return Command::Clear;
    if (command == "help" || command == "h" || command == "--help" || command == "-h")
        return Command::Help;
    throw CliError("Unknown command: " + command);
}

bool parse_bool(const std::string& flag, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw CliError("Flag " + flag + " expects true or false, got '" + value + "'");
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Flag " + flag + " expects an integer, got '" + value + "'");
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw CliError("Flag " + flag + " expects an integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw CliError("Flag " + flag + " is out of range: " + value);
    }
}

float parse_float(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        float result = std::stof(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Flag " + flag + " expects a number, got '" + value + "'");
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw CliError("Flag " + flag + " expects a number, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw CliError("Flag " + flag + " is out of range: " + value);
    }
}

void require(bool condition, const std::string& usage) {
    if (!condition) {
        throw CliError("Missing required flag. Usage: " + usage);
    }
}

}  // namespace

CliHandler::CliHandler(ServiceFactory factory) : factory_(std::move(factory)) {}

CliHandler::~CliHandler() = default;

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    std::optional<std::string> command;

    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];

        if (token.rfind("--", 0) != 0 && token != "-h") {
            if (command) {
                throw CliError("Unexpected argument: " + token);
            }
            command = token;
            continue;
        }
        if (token == "--help" || token == "-h") {
            command = token;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Flag " + token + " requires a value");
        }
        std::string value = argv[++i];

        if (token == "--config") {
            options.config_path = value;
        } else if (token == "--output") {
            options.output_path = value;
        } else if (token == "--file") {
            options.file_path = value;
        } else if (token == "--athlete") {
            options.athlete = value;
        } else if (token == "--query") {
            options.query = value;
        } else if (token == "--top-k") {
            options.top_k = parse_int(token, value);
        } else if (token == "--min-similarity") {
            options.min_similarity = parse_float(token, value);
        } else if (token == "--reindex") {
            options.reindex = parse_bool(token, value);
        } else if (token == "--yes") {
            options.confirmed = parse_bool(token, value);
        } else {
            throw CliError("Unknown flag: " + token);
        }
    }

    if (!command) {
        options.command = Command::Help;
        return options;
    }
    options.command = command_from_string(*command);

    switch (options.command) {
        case Command::Import:
            require(!options.file_path.empty(), "import --file <crawler export>");
            break;
        case Command::Index:
            require(!options.athlete.empty(), "index --athlete <name> [--reindex true]");
            break;
        case Command::Batch:
            require(!options.file_path.empty(), "batch --file <json list of athlete names>");
            break;
        case Command::Search:
            require(!options.query.empty(),
                    "search --query <text> [--athlete <name>] [--top-k n] [--min-similarity x]");
            if (options.top_k && *options.top_k <= 0) {
                throw CliError("--top-k must be greater than 0");
            }
            break;
        case Command::Delete:
            require(!options.athlete.empty(), "delete --athlete <name>");
            break;
        default:
            break;
    }
    return options;
}

athlete_core::Config CliHandler::load_config(const std::string& config_path) {
    if (config_path.empty()) {
        return athlete_core::Config::from_json(nlohmann::json::object());
    }
    return athlete_core::Config::from_file(config_path);
}

athlete_core::ServiceProvider& CliHandler::services(const CliOptions& options) {
    if (!services_) {
        services_ = factory_(load_config(options.config_path));
        if (!services_) {
            throw CliError("Failed to initialize services");
        }
    }
    return *services_;
}

nlohmann::json CliHandler::execute_command(const CliOptions& options) {
    nlohmann::json result;
    switch (options.command) {
        case Command::Import:
            result = handle_import_command(options);
            break;
        case Command::Index:
            result = handle_index_command(options);
            break;
        case Command::Batch:
            result = handle_batch_command(options);
            break;
        case Command::Search:
            result = handle_search_command(options);
            break;
        case Command::Stats:
            result = handle_stats_command(options);
            break;
        case Command::Delete:
            result = handle_delete_command(options);
            break;
        case Command::Rebuild:
            result = handle_rebuild_command(options);
            break;
        case Command::Clear:
            result = handle_clear_command(options);
            break;
        case Command::Help:
            print_help();
            return result;
    }
    emit(result, options);
    return result;
}

nlohmann::json CliHandler::handle_import_command(const CliOptions& options) {
    athlete_core::ImportResult imported =
        services(options).get_source_document_repo().import_from_json_file(options.file_path);
    return {{"file", options.file_path},
            {"imported", imported.imported},
            {"skipped", imported.skipped}};
}

nlohmann::json CliHandler::handle_index_command(const CliOptions& options) {
    // A single-athlete batch so that a failure still yields a stats record
    std::vector<athlete_core::IndexingStats> stats =
        services(options).get_indexing_pipeline().process_all({options.athlete}, !options.reindex);
    return stats.front().to_json();
}

nlohmann::json CliHandler::handle_batch_command(const CliOptions& options) {
    std::vector<std::string> athletes = read_athlete_list(options.file_path);
    std::vector<athlete_core::IndexingStats> stats =
        services(options).get_indexing_pipeline().process_all(athletes, !options.reindex);

    nlohmann::json results = nlohmann::json::array();
    int failed = 0;
    for (const auto& entry : stats) {
        if (entry.status == athlete_core::IndexingStatus::ERROR) {
            ++failed;
        }
        results.push_back(entry.to_json());
    }
    return {{"athletes", athletes.size()},
            {"failed", failed},
            {"results", std::move(results)}};
}

nlohmann::json CliHandler::handle_search_command(const CliOptions& options) {
    athlete_core::ServiceProvider& provider = services(options);
    const athlete_core::Config& config = provider.get_config();

    std::optional<std::string> athlete_filter;
    if (!options.athlete.empty()) {
        athlete_filter = options.athlete;
    }
    const int top_k = options.top_k.value_or(config.top_k_chunks);
    const float min_similarity = options.min_similarity.value_or(config.min_similarity);

    std::vector<athlete_core::RetrievedChunk> chunks =
        provider.get_retrieval_service().retrieve(options.query, athlete_filter, top_k,
                                                  min_similarity);

    nlohmann::json results = nlohmann::json::array();
    for (const auto& chunk : chunks) {
        results.push_back(athlete_core::RetrievalService::to_json(chunk));
    }
    nlohmann::json response = {{"query", options.query},
                               {"top_k", top_k},
                               {"min_similarity", min_similarity},
                               {"results", std::move(results)}};
    if (athlete_filter) {
        response["athlete_name"] = *athlete_filter;
    }
    return response;
}

nlohmann::json CliHandler::handle_stats_command(const CliOptions& options) {
    std::optional<std::string> athlete;
    if (!options.athlete.empty()) {
        athlete = options.athlete;
    }
    return services(options).get_maintenance_service().get_stats(athlete).to_json();
}

nlohmann::json CliHandler::handle_delete_command(const CliOptions& options) {
    int64_t deleted = services(options).get_maintenance_service().delete_athlete(options.athlete);
    return {{"athlete_name", options.athlete}, {"deleted_chunks", deleted}};
}

nlohmann::json CliHandler::handle_rebuild_command(const CliOptions& options) {
    athlete_core::RebuildResult rebuilt = services(options).get_maintenance_service().rebuild_index();
    return {{"reindexed", rebuilt.reindexed}, {"skipped", rebuilt.skipped}};
}

nlohmann::json CliHandler::handle_clear_command(const CliOptions& options) {
    if (!options.confirmed) {
        throw CliError("clear deletes every indexed chunk. Re-run with --yes true to confirm.");
    }
    int64_t deleted = services(options).get_maintenance_service().clear();
    return {{"deleted_chunks", deleted}};
}

std::vector<std::string> CliHandler::read_athlete_list(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw CliError("Could not open athlete list: " + path);
    }
    nlohmann::json list = nlohmann::json::parse(in, nullptr, /*allow_exceptions*/ false);
    if (list.is_object() && list.contains("athletes")) {
        list = list["athletes"];
    }
    if (list.is_discarded() || !list.is_array()) {
        throw CliError("Athlete list must be a JSON array of names: " + path);
    }

    std::vector<std::string> athletes;
    for (const auto& entry : list) {
        if (!entry.is_string() || entry.get<std::string>().empty()) {
            throw CliError("Athlete list must only contain non-empty strings: " + path);
        }
        athletes.push_back(entry.get<std::string>());
    }
    return athletes;
}

void CliHandler::emit(const nlohmann::json& result, const CliOptions& options) {
    std::cout << result.dump(2) << std::endl;

    if (!options.output_path.empty()) {
        std::filesystem::path output(options.output_path);
        if (output.has_parent_path()) {
            std::filesystem::create_directories(output.parent_path());
        }
        std::ofstream out(output);
        if (!out) {
            throw CliError("Could not write output file: " + options.output_path);
        }
        out << result.dump(2) << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
Athlete Index CLI - passage indexing and retrieval

Usage: athlete_cli [--config <file>] [--output <file>] <command> [options]

Data:
  import, i     Load crawler documents into the source table
    --file <path>            JSON array or JSON Lines export

Indexing:
  index, x      Index one athlete
    --athlete <name>         Athlete to index
    --reindex true           Re-read passages that already have chunks

  batch, b      Index every athlete in a list; failures do not stop the batch
    --file <path>            JSON array of athlete names

Retrieval:
  search, s     Semantic search over indexed chunks
    --query <text>           Search query
    --athlete <name>         Only return chunks of this athlete
    --top-k <num>            Number of results (default: top_k_chunks)
    --min-similarity <x>     Cosine threshold (default: min_similarity)

Maintenance:
  stats         Chunk and vector counts
    --athlete <name>         Restrict counts to one athlete
  delete        Remove an athlete's chunks and rebuild the index
    --athlete <name>
  rebuild       Rebuild the vector index from stored embeddings
  clear         Remove every chunk and empty the index
    --yes true               Required confirmation

General:
  help, h       Show this help message
  --config <file>            JSON configuration (defaults when omitted)
  --output <file>            Also write the JSON result to a file

Examples:
  athlete_cli import --file data/crawl.jsonl
  athlete_cli index --athlete "Mikaela Shiffrin"
  athlete_cli search --query "world cup slalom wins" --athlete "Mikaela Shiffrin" --top-k 3
)" << std::endl;
}

}  // namespace athlete_cli
