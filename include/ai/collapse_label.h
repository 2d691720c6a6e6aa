#pragma once
#ifndef ECORISK_COLLAPSE_LABEL_H
#define ECORISK_COLLAPSE_LABEL_H

#include "snapshot.h"

namespace ecorisk {
namespace ai {

constexpr double kCollapsePlantThreshold = 5.0;

// Collapse: plants below 5 or either animal population extinct
bool is_collapse(const Snapshot& s);

inline float collapse_label(const Snapshot& s) { return is_collapse(s) ? 1.0f : 0.0f; }

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_COLLAPSE_LABEL_H
