// Repository: KitchenSync
// Component: Cue Model
// Purpose: Timed trigger events and the sorted cue list a session plays.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_CUES_CUE_HPP_
#define KITCHENSYNC_CUES_CUE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kitchensync::cues {

enum class CueType {
  kNoteOn,
  kNoteOff,
  kControlChange,
};

// Wire name ("note_on", "note_off", "control_change").
const char* CueTypeName(CueType type);
std::optional<CueType> ParseCueType(const std::string& name);

inline constexpr int32_t kMinChannel = 1;
inline constexpr int32_t kMaxChannel = 16;
inline constexpr int32_t kMaxDataByte = 127;

// A single timestamped trigger. Parameters not used by a type stay zero
// (note/velocity for note events, control/value for control changes).
struct Cue {
  double time = 0.0;  // seconds from session start, >= 0
  CueType type = CueType::kNoteOn;
  int32_t channel = 1;  // 1..16
  int32_t note = 0;
  int32_t velocity = 0;
  int32_t control = 0;
  int32_t value = 0;
  std::string description;

  bool operator==(const Cue& other) const;
  bool operator!=(const Cue& other) const { return !(*this == other); }
};

// Sorted ascending by time. Never mutated once loaded into a scheduler;
// a new schedule replaces it wholesale.
using CueList = std::vector<Cue>;

// Stable sort by time (cues sharing a timestamp keep their source order).
void SortCues(CueList& cues);

bool IsSorted(const CueList& cues);

// Returns the first violated rule, or nullopt if the cue is valid.
std::optional<std::string> ValidateCue(const Cue& cue);

// One-line human readable form, e.g. "note_on ch1 note=60 vel=127 @1.500s".
std::string DescribeCue(const Cue& cue);

}  // namespace kitchensync::cues

#endif  // KITCHENSYNC_CUES_CUE_HPP_
