#include "sandbox/sandbox.hpp"

namespace sandbox {

const char* ResourceName(Resource resource) {
  switch (resource) {
    case Resource::NONE:
      return "none";
    case Resource::MEMORY:
      return "memory";
    case Resource::CPU_TIME:
      return "cpu time";
    case Resource::PROCESSES:
      return "processes";
    case Resource::FILE_SIZE:
      return "file size";
  }
  return "unknown";
}

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(const std::string& name, Sandbox::create_t create,
                        Sandbox::score_t score) {
  Boxes_()->push_back({name, std::move(create), std::move(score)});
}

std::vector<std::string> Sandbox::Names() {
  std::vector<std::string> names;
  for (const Entry& box : *Boxes_()) names.push_back(box.name);
  return names;
}

std::unique_ptr<Sandbox> Sandbox::Create(const std::string& name) {
  const store_t& boxes = *Boxes_();
  if (name != "auto") {
    for (const Entry& box : boxes) {
      if (box.name == name && box.score() >= 0) {
        return std::unique_ptr<Sandbox>(box.create());
      }
    }
    return nullptr;
  }
  const Entry* best = nullptr;
  int best_score = 0;
  for (const Entry& box : boxes) {
    int score = box.score();
    if (score > best_score) {
      best_score = score;
      best = &box;
    }
  }
  if (best == nullptr) return nullptr;
  return std::unique_ptr<Sandbox>(best->create());
}

}  // namespace sandbox
