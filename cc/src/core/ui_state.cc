#include "deskbridge/core/ui_state.h"

#include <utility>

#include "absl/strings/str_cat.h"

namespace deskbridge {
namespace core {

void UiState::SetTitle(std::string title) {
  if (title.empty()) {
    title_.reset();
  } else {
    title_ = std::move(title);
  }
}

std::string UiState::WindowTitle(const std::string& app_name) const {
  if (!title_) return app_name;
  return absl::StrCat(*title_, " - ", app_name);
}

}  // namespace core
}  // namespace deskbridge
