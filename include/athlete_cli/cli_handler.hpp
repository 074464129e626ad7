#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "athlete_core/config.hpp"
#include "athlete_core/services/service_provider.hpp"

namespace athlete_cli
{

  enum class Command
  {
    Import,
    Index,
    Batch,
    Search,
    Stats,
    Delete,
    Rebuild,
    Clear,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path;
    std::string output_path;
    std::string file_path;
    std::string athlete;
    std::string query;
    std::optional<int> top_k;
    std::optional<float> min_similarity;
    bool reindex = false;
    bool confirmed = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  using ServiceFactory =
      std::function<std::unique_ptr<athlete_core::ServiceProvider>(const athlete_core::Config &)>;

  class CliHandler
  {
  public:
    // The factory is called once, on the first command that needs the engine
    explicit CliHandler(ServiceFactory factory = athlete_core::ServiceProvider::create);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments. Global flags (--config, --output) may
    // appear before or after the command.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Runs the command, prints its JSON result and returns it
    nlohmann::json execute_command(const CliOptions &options);

    static athlete_core::Config load_config(const std::string &config_path);

  private:
    ServiceFactory factory_;
    std::unique_ptr<athlete_core::ServiceProvider> services_;

    athlete_core::ServiceProvider &services(const CliOptions &options);

    // Command handlers
    nlohmann::json handle_import_command(const CliOptions &options);
    nlohmann::json handle_index_command(const CliOptions &options);
    nlohmann::json handle_batch_command(const CliOptions &options);
    nlohmann::json handle_search_command(const CliOptions &options);
    nlohmann::json handle_stats_command(const CliOptions &options);
    nlohmann::json handle_delete_command(const CliOptions &options);
    nlohmann::json handle_rebuild_command(const CliOptions &options);
    nlohmann::json handle_clear_command(const CliOptions &options);

    // Helper methods
    static std::vector<std::string> read_athlete_list(const std::string &path);
    void emit(const nlohmann::json &result, const CliOptions &options);
    void print_help();
  };

}
