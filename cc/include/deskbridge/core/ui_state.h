#ifndef DESKBRIDGE_CORE_UI_STATE_H_
#define DESKBRIDGE_CORE_UI_STATE_H_

#include <optional>
#include <string>

namespace deskbridge {
namespace core {

// Shell-wide view flags. Owned by the application and handed to views by
// reference.
class UiState {
 public:
  bool IsDarkMode() const { return dark_mode_; }
  void SetDarkMode(bool dark_mode) { dark_mode_ = dark_mode; }
  void ToggleDarkMode() { dark_mode_ = !dark_mode_; }

  const std::optional<std::string>& GetTitle() const { return title_; }
  void SetTitle(std::string title);
  std::string WindowTitle(const std::string& app_name) const;

  bool IsSidebarCollapsed() const { return sidebar_collapsed_; }
  void SetSidebarCollapsed(bool collapsed) { sidebar_collapsed_ = collapsed; }

  bool IsCollapsible() const { return collapsible_; }
  void SetCollapsible(bool collapsible) { collapsible_ = collapsible; }

 private:
  bool dark_mode_ = false;
  std::optional<std::string> title_;
  bool sidebar_collapsed_ = true;
  bool collapsible_ = false;
};

}  // namespace core
}  // namespace deskbridge

#endif  // DESKBRIDGE_CORE_UI_STATE_H_
