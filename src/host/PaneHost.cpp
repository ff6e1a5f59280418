#include "PaneHost.hpp"

namespace tt {
SplitDirection splitDirectionFromString(const string& s) {
  string lower = toLower(trim(s));
  if (lower == "up") return SplitDirection::UP;
  if (lower == "down") return SplitDirection::DOWN;
  if (lower == "left") return SplitDirection::LEFT;
  if (lower == "right") return SplitDirection::RIGHT;
  throw std::invalid_argument("Invalid split direction: " + s);
}

string splitDirectionToString(SplitDirection direction) {
  switch (direction) {
    case SplitDirection::UP:
      return "Up";
    case SplitDirection::DOWN:
      return "Down";
    case SplitDirection::LEFT:
      return "Left";
    case SplitDirection::RIGHT:
      return "Right";
  }
  return "Up";
}
}  // namespace tt
