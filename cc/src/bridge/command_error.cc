#include "deskbridge/bridge/command_error.h"

#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace deskbridge {
namespace bridge {

namespace {

constexpr absl::string_view kArgsPrefix = "invalid args `";
constexpr absl::string_view kCommandInfix = "` for command `";

// Cuts a non-empty backtick-terminated token off the front of `text`.
bool ConsumeQuoted(absl::string_view* text, absl::string_view* token) {
  const size_t end = text->find('`');
  if (end == 0 || end == absl::string_view::npos) return false;
  *token = text->substr(0, end);
  text->remove_prefix(end);
  return true;
}

// Recognizes "invalid args `<field>` for command `<command>`:<anything>".
// Only the prefix is inspected, so the trailing text may be arbitrarily long.
bool ParseMissingArgument(absl::string_view text, absl::string_view* field,
                          absl::string_view* command) {
  if (!absl::StartsWithIgnoreCase(text, kArgsPrefix)) return false;
  text.remove_prefix(kArgsPrefix.size());
  if (!ConsumeQuoted(&text, field)) return false;
  if (!absl::StartsWithIgnoreCase(text, kCommandInfix)) return false;
  text.remove_prefix(kCommandInfix.size());
  if (!ConsumeQuoted(&text, command)) return false;
  return absl::StartsWith(text, "`:");
}

}  // namespace

const char* CommandError::Category() const {
  switch (kind) {
    case ErrorKind::kMissingArgument: return "missing-args";
    case ErrorKind::kHostFailure:     return "host-failure";
    case ErrorKind::kInvalidFormat:   return "invalid-format";
    case ErrorKind::kNone:            return "none";
  }
  return "unknown";
}

CommandError CommandError::MissingArgument(const std::string& field,
                                           const std::string& command) {
  CommandError error;
  error.kind = ErrorKind::kMissingArgument;
  error.field = field;
  error.command = command;
  error.message = absl::StrCat("Missing required field '", field,
                               "' for command '", command, "'");
  return error;
}

CommandError CommandError::HostFailure(const nlohmann::json& raw) {
  CommandError error;
  error.kind = ErrorKind::kHostFailure;
  error.raw = raw;
  error.message =
      raw.is_string()
          ? raw.get<std::string>()
          : raw.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return error;
}

CommandError CommandError::InvalidFormat(const std::string& detail) {
  CommandError error;
  error.kind = ErrorKind::kInvalidFormat;
  error.message = detail;
  return error;
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:            return "None";
    case ErrorKind::kMissingArgument: return "MissingArgument";
    case ErrorKind::kHostFailure:     return "HostFailure";
    case ErrorKind::kInvalidFormat:   return "InvalidFormat";
  }
  return "Unknown";
}

CommandError ClassifyHostFailure(const std::string& invoked_command,
                                 const nlohmann::json& raw) {
  if (raw.is_string()) {
    absl::string_view field;
    absl::string_view command;
    if (ParseMissingArgument(raw.get_ref<const std::string&>(), &field,
                             &command) &&
        command == invoked_command) {
      return CommandError::MissingArgument(std::string(field),
                                           std::string(command));
    }
  }
  return CommandError::HostFailure(raw);
}

InvokeResult InvokeResult::Success(nlohmann::json value) {
  InvokeResult result;
  result.ok = true;
  result.value = std::move(value);
  return result;
}

InvokeResult InvokeResult::Failure(CommandError error) {
  InvokeResult result;
  result.ok = false;
  result.error = std::move(error);
  return result;
}

}  // namespace bridge
}  // namespace deskbridge
