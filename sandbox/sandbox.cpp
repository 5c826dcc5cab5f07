#include "sandbox/sandbox.hpp"

#include "glog/logging.h"

namespace sandbox {

Sandbox::registry_t* Sandbox::Registry() {
  static registry_t* registry = new registry_t;
  return registry;
}

void Sandbox::Add(create_t create, score_t score) {
  Registry()->emplace_back(std::move(create), std::move(score));
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  // Scores do not change while the process runs.
  static const int chosen = []() {
    int index = -1;
    int best_score = 0;
    const registry_t& registry = *Registry();
    for (size_t i = 0; i < registry.size(); i++) {
      int score = registry[i].second();
      VLOG(1) << "Sandbox implementation " << i << " has score " << score;
      if (score > best_score) {
        best_score = score;
        index = i;
      }
    }
    return index;
  }();
  if (chosen < 0) {
    LOG(ERROR) << "No usable sandbox implementation";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>((*Registry())[chosen].first());
}

}  // namespace sandbox
