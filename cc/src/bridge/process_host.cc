#include "deskbridge/bridge/process_host.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace bridge {

ProcessHost::ProcessHost(std::string helper_path, DispatchQueue& queue)
    : helper_path_(std::move(helper_path)),
      queue_(queue),
      listeners_(std::make_shared<ListenerRegistry>()),
      closing_(std::make_shared<std::atomic<bool>>(false)) {}

ProcessHost::~ProcessHost() {
  closing_->store(true);
  for (auto& worker : workers_) {
    if (worker.state->finished.load()) continue;
    const pid_t pid = worker.state->pid.load();
    if (pid > 0) {
      DESKBRIDGE_LOG_WARN(absl::StrCat("ProcessHost: terminating helper pid ",
                                       pid, " on shutdown"));
      kill(-pid, SIGTERM);
    }
  }
  for (auto& worker : workers_) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

void ProcessHost::Dispatch(const std::string& command,
                           const nlohmann::json& args, ReplyCallback done) {
  ReapFinishedWorkers();

  const std::string command_line =
      absl::StrCat(ShellQuote(helper_path_), " ", ShellQuote(command), " ",
                   ShellQuote(args.dump(
                       -1, ' ', false,
                       nlohmann::json::error_handler_t::replace)));
  DESKBRIDGE_LOG_DEBUG("ProcessHost: " + command_line);

  auto state = std::make_shared<WorkerState>();
  std::weak_ptr<ListenerRegistry> weak_listeners = listeners_;
  std::shared_ptr<std::atomic<bool>> closing = closing_;
  DispatchQueue* queue = &queue_;

  std::thread thread([command_line, state, weak_listeners, closing, queue,
                      done = std::move(done)]() {
    std::string body;
    int exit_code = RunHelper(command_line, *closing, &state->pid,
                              [&](const std::string& line) {
      std::string event;
      nlohmann::json payload;
      if (ParseEventLine(line, &event, &payload)) {
        queue->Post([weak_listeners, event, payload]() {
          if (auto listeners = weak_listeners.lock()) {
            listeners->Deliver(event, payload);
          }
        });
        return;
      }
      if (!body.empty()) body += "\n";
      body += line;
    });

    HostReply reply;
    if (exit_code < 0) {
      reply.ok = false;
      reply.value = "Failed to start host helper: " + command_line;
    } else {
      reply = BuildReply(body, exit_code);
    }
    // A helper killed during teardown has no one left to answer.
    if (done && !closing->load()) {
      queue->Post([done, reply]() { done(reply); });
    }
    state->finished.store(true);
  });

  workers_.push_back(Worker{std::move(thread), state});
}

ProcessHost::ListenerId ProcessHost::Listen(const std::string& event,
                                            EventHandler handler) {
  return listeners_->Add(event, std::move(handler));
}

void ProcessHost::Unlisten(ListenerId id) { listeners_->Remove(id); }

size_t ProcessHost::InFlight() const {
  size_t count = 0;
  for (const auto& worker : workers_) {
    if (!worker.state->finished.load()) ++count;
  }
  return count;
}

bool ProcessHost::ParseEventLine(const std::string& line, std::string* event,
                                 nlohmann::json* payload) {
  const std::string trimmed(absl::StripAsciiWhitespace(line));
  if (trimmed.empty() || trimmed.front() != '{') return false;

  nlohmann::json parsed = nlohmann::json::parse(trimmed, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) return false;

  auto it = parsed.find("event");
  if (it == parsed.end() || !it->is_string()) return false;

  *event = it->get<std::string>();
  *payload = parsed.contains("payload") ? parsed["payload"] : nlohmann::json();
  return true;
}

HostReply ProcessHost::BuildReply(const std::string& body, int exit_code) {
  HostReply reply;
  const std::string trimmed(absl::StripAsciiWhitespace(body));

  if (exit_code != 0) {
    reply.ok = false;
    reply.value = trimmed.empty()
                      ? absl::StrCat("Host helper exited with code ", exit_code)
                      : trimmed;
    return reply;
  }

  reply.ok = true;
  if (trimmed.empty()) {
    reply.value = nullptr;
    return reply;
  }
  nlohmann::json parsed = nlohmann::json::parse(trimmed, nullptr, false);
  if (parsed.is_discarded()) {
    reply.value = trimmed;
  } else {
    reply.value = std::move(parsed);
  }
  return reply;
}

std::string ProcessHost::ShellQuote(const std::string& arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

int ProcessHost::RunHelper(const std::string& command_line,
                           const std::atomic<bool>& closing,
                           std::atomic<pid_t>* pid_out,
                           const LineCallback& on_line) {
  if (closing.load()) return -1;

  // Close-on-exec keeps helpers started by other workers from holding this
  // pipe open; dup2 clears the flag on the child's stdout and stderr.
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    DESKBRIDGE_LOG_ERROR("Failed to create pipe for: " + command_line);
    return -1;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(fds[0]);
    close(fds[1]);
    DESKBRIDGE_LOG_ERROR("Failed to execute command: " + command_line);
    return -1;
  }
  if (pid == 0) {
    // Own process group, so teardown can signal the helper and its children.
    setpgid(0, 0);
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    close(fds[0]);
    close(fds[1]);
    execl("/bin/sh", "sh", "-c", command_line.c_str(),
          static_cast<char*>(nullptr));
    _exit(127);
  }

  setpgid(pid, pid);
  pid_out->store(pid);
  close(fds[1]);
  // Teardown may have started before the pid was visible to it.
  if (closing.load()) kill(-pid, SIGTERM);

  FILE* out = fdopen(fds[0], "r");
  if (!out) {
    close(fds[0]);
    kill(-pid, SIGTERM);
    waitpid(pid, nullptr, 0);
    pid_out->store(0);
    DESKBRIDGE_LOG_ERROR("Failed to read output of: " + command_line);
    return -1;
  }

  std::array<char, 4096> buffer;
  std::string pending;
  while (fgets(buffer.data(), buffer.size(), out) != nullptr) {
    pending += buffer.data();
    if (!pending.empty() && pending.back() == '\n') {
      pending.pop_back();
      on_line(pending);
      pending.clear();
    }
  }
  if (!pending.empty()) on_line(pending);
  fclose(out);

  int status = 0;
  pid_t waited;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  pid_out->store(0);
  if (waited < 0) return -1;
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

void ProcessHost::ReapFinishedWorkers() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->state->finished.load()) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace bridge
}  // namespace deskbridge
