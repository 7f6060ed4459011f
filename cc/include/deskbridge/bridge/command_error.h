#ifndef DESKBRIDGE_BRIDGE_COMMAND_ERROR_H_
#define DESKBRIDGE_BRIDGE_COMMAND_ERROR_H_

#include <string>

#include <nlohmann/json.hpp>

namespace deskbridge {
namespace bridge {

enum class ErrorKind {
  kNone,
  kMissingArgument,  // Host rejected the call for a missing/invalid argument.
  kHostFailure,      // Any other host failure, carried verbatim.
  kInvalidFormat     // Host answered with something that is not a document.
};

// Failure of a single command invocation. Not retained past the callback
// that receives it.
struct CommandError {
  ErrorKind kind = ErrorKind::kNone;

  // kMissingArgument
  std::string field;
  std::string command;

  // kHostFailure: the host's failure value exactly as received.
  nlohmann::json raw;

  std::string message;

  bool IsError() const { return kind != ErrorKind::kNone; }
  const char* Category() const;

  static CommandError MissingArgument(const std::string& field,
                                      const std::string& command);
  static CommandError HostFailure(const nlohmann::json& raw);
  static CommandError InvalidFormat(const std::string& detail);
};

const char* ErrorKindName(ErrorKind kind);

// Maps a raw host failure for `invoked_command` onto the error taxonomy.
// Strings shaped like "invalid args `<field>` for command `<command>`: ..."
// (any case) become kMissingArgument when <command> is the invoked command;
// everything else becomes kHostFailure with `raw` untouched.
CommandError ClassifyHostFailure(const std::string& invoked_command,
                                 const nlohmann::json& raw);

// Outcome of Invoke. `value` is meaningful only when `ok` is set.
struct InvokeResult {
  bool ok = false;
  nlohmann::json value;
  CommandError error;

  static InvokeResult Success(nlohmann::json value);
  static InvokeResult Failure(CommandError error);
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_COMMAND_ERROR_H_
