/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for usagemonitor.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef USAGEMONITOR_CLI_HPP
#define USAGEMONITOR_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace umon {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code requested by the parser.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * Values flagged as explicit override the configuration file.
 */
struct CliOptions {
  bool verbose = false;
  std::string config_file;

  std::string log_level = "info";
  bool log_level_explicit = false;
  std::string log_file;
  int log_rotate = 3;
  bool log_rotate_explicit = false;
  bool log_compress = false;
  bool log_compress_explicit = false;
  std::unordered_map<std::string, std::string> log_categories;

  std::string organization_id;
  std::string session_token;
  /// Credentials came from USAGEMONITOR_* environment variables.
  bool credentials_from_env = false;
  bool save_credentials = false;
  bool clear_credentials = false;

  /// Refresh interval in minutes, rounded up from `--interval`.
  std::optional<int> interval_minutes;
  bool disable_auto_refresh = false;
  bool hourly_refresh = false;
  bool once = false;

  /// Range preset for `--history`.
  std::string history_range;
  std::optional<int> prune_history_days;
  std::string export_csv;
  std::string export_json;

  /// Whether any credentials were supplied.
  bool has_credentials() const {
    return !organization_id.empty() || !session_token.empty();
  }
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return Parsed options.
 * @throws CliParseExit When parsing requests an exit (help, version, errors).
 * @throws CLI::ValidationError When options conflict after parsing.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace umon

#endif // USAGEMONITOR_CLI_HPP
