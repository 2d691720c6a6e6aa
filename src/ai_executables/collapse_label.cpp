#include "ai/collapse_label.h"

namespace ecorisk {
namespace ai {

bool is_collapse(const Snapshot& s) {
    return s.plants < kCollapsePlantThreshold ||
           s.herbivores == 0.0 ||
           s.carnivores == 0.0;
}

} // namespace ai
} // namespace ecorisk
