// Repository: KitchenSync
// Component: Cue Model Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/cues/Cue.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace kitchensync::cues {

const char* CueTypeName(CueType type) {
  switch (type) {
    case CueType::kNoteOn:
      return "note_on";
    case CueType::kNoteOff:
      return "note_off";
    case CueType::kControlChange:
      return "control_change";
  }
  return "unknown";
}

std::optional<CueType> ParseCueType(const std::string& name) {
  if (name == "note_on") return CueType::kNoteOn;
  if (name == "note_off") return CueType::kNoteOff;
  if (name == "control_change") return CueType::kControlChange;
  return std::nullopt;
}

bool Cue::operator==(const Cue& other) const {
  return time == other.time && type == other.type && channel == other.channel &&
         note == other.note && velocity == other.velocity && control == other.control &&
         value == other.value && description == other.description;
}

void SortCues(CueList& cues) {
  std::stable_sort(cues.begin(), cues.end(),
                   [](const Cue& a, const Cue& b) { return a.time < b.time; });
}

bool IsSorted(const CueList& cues) {
  return std::is_sorted(cues.begin(), cues.end(),
                        [](const Cue& a, const Cue& b) { return a.time < b.time; });
}

std::optional<std::string> ValidateCue(const Cue& cue) {
  if (!std::isfinite(cue.time) || cue.time < 0.0) {
    return "time must be a finite value >= 0";
  }
  if (cue.channel < kMinChannel || cue.channel > kMaxChannel) {
    return "channel must be in 1..16 (got " + std::to_string(cue.channel) + ")";
  }
  auto in_range = [](int32_t v) { return v >= 0 && v <= kMaxDataByte; };
  if (!in_range(cue.note) || !in_range(cue.velocity) || !in_range(cue.control) ||
      !in_range(cue.value)) {
    return "note/velocity/control/value must be in 0..127";
  }
  return std::nullopt;
}

std::string DescribeCue(const Cue& cue) {
  std::ostringstream o;
  o << CueTypeName(cue.type) << " ch" << cue.channel;
  if (cue.type == CueType::kControlChange) {
    o << " cc" << cue.control << "=" << cue.value;
  } else {
    o << " note=" << cue.note << " vel=" << cue.velocity;
  }
  o << " @" << std::fixed << std::setprecision(3) << cue.time << "s";
  return o.str();
}

}  // namespace kitchensync::cues
