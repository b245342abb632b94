#ifndef USAGEMONITOR_NOTIFICATION_HPP
#define USAGEMONITOR_NOTIFICATION_HPP

#include <cstdlib>
#include <functional>
#include <memory>
#include <string>

namespace umon {

/**
 * Interface for dispatching user notifications.
 *
 * Custom implementations may route messages to desktop systems,
 * logging facilities or external services.
 */
class Notifier {
public:
  virtual ~Notifier() = default;

  /**
   * Ask whether notifications may be shown.
   *
   * @return `true` when delivery is possible. A denied permission is not an
   *         error; callers simply skip delivery.
   */
  virtual bool request_permission() = 0;

  /**
   * Send a notification to the user.
   *
   * @param title Short headline.
   * @param body Message text.
   */
  virtual void notify(const std::string &title, const std::string &body) = 0;
};

/**
 * Desktop notifier that invokes platform-specific utilities:
 *
 * - Linux: `notify-send`
 * - Windows: BurntToast PowerShell module
 * - macOS: `terminal-notifier` (preferred) or `osascript`
 */
class DesktopNotifier : public Notifier {
public:
  using CommandRunner = std::function<int(const std::string &)>;

  /**
   * Construct a notifier that executes platform-specific commands.
   *
   * @param runner Callback responsible for executing shell commands. The
   *        default implementation delegates to `std::system`.
   */
  explicit DesktopNotifier(CommandRunner runner =
                               [](const std::string &cmd) {
                                 return std::system(cmd.c_str());
                               });

  /// Probe for the platform notification tool.
  bool request_permission() override;

  void notify(const std::string &title, const std::string &body) override;

private:
  CommandRunner run_;
};

using NotifierPtr = std::shared_ptr<Notifier>;

} // namespace umon

#endif // USAGEMONITOR_NOTIFICATION_HPP
