#ifndef DESKBRIDGE_BRIDGE_PROCESS_HOST_H_
#define DESKBRIDGE_BRIDGE_PROCESS_HOST_H_

#include <sys/types.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "deskbridge/bridge/dispatch_queue.h"
#include "deskbridge/bridge/host.h"
#include "deskbridge/bridge/listener_registry.h"

namespace deskbridge {
namespace bridge {

// Host backed by a helper executable.
//
// Each command runs `<helper> <command> '<args-json>'` on a worker thread.
// Output lines of the form {"event": "<name>", "payload": ...} are push-events
// and are delivered as soon as they are read. The remaining output is the
// reply: JSON when it parses, plain text otherwise, null when empty. A
// non-zero exit status makes the reply a failure carrying that text.
//
// Replies and events are posted to `queue`, so callbacks run on whichever
// thread pumps it. The queue must outlive this host.
//
// Each helper runs in its own process group. Destroying the host sends
// SIGTERM to the groups of helpers still running and waits for them; their
// replies are dropped.
class ProcessHost : public Host {
 public:
  ProcessHost(std::string helper_path, DispatchQueue& queue);
  ~ProcessHost() override;

  ProcessHost(const ProcessHost&) = delete;
  ProcessHost& operator=(const ProcessHost&) = delete;

  void Dispatch(const std::string& command, const nlohmann::json& args,
                ReplyCallback done) override;
  ListenerId Listen(const std::string& event, EventHandler handler) override;
  void Unlisten(ListenerId id) override;

  const std::string& GetHelperPath() const { return helper_path_; }
  size_t InFlight() const;

  // Recognizes an event line; returns false for anything else.
  static bool ParseEventLine(const std::string& line, std::string* event,
                             nlohmann::json* payload);
  // Turns the non-event output of a finished helper into a reply.
  static HostReply BuildReply(const std::string& body, int exit_code);
  static std::string ShellQuote(const std::string& arg);

 private:
  using LineCallback = std::function<void(const std::string&)>;

  struct WorkerState {
    std::atomic<bool> finished{false};
    std::atomic<pid_t> pid{0};  // 0 when no child is running
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<WorkerState> state;
  };

  // Runs the helper under /bin/sh with stderr merged into stdout, feeding
  // each complete output line to `on_line`. The child pid is published in
  // `pid_out` while it runs. Returns the exit code, or -1 if the helper could
  // not be started or `closing` was already set.
  static int RunHelper(const std::string& command_line,
                       const std::atomic<bool>& closing,
                       std::atomic<pid_t>* pid_out,
                       const LineCallback& on_line);
  void ReapFinishedWorkers();

  std::string helper_path_;
  DispatchQueue& queue_;
  std::shared_ptr<ListenerRegistry> listeners_;
  std::vector<Worker> workers_;
  std::shared_ptr<std::atomic<bool>> closing_;
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_PROCESS_HOST_H_
