#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace peq {

enum class Preset {
    Flat,
    Rock,
    Pop,
    Jazz,
    Classical,
    Electronic,
    HipHop,
    Acoustic,
    Vocal,
    BassBoost,
};

using PresetGains = std::array<double, 10>;

struct PresetEntry {
    Preset preset;
    const char* id;
    PresetGains gains;
};

// Bands: 31Hz 62Hz 125Hz 250Hz 500Hz 1kHz 2kHz 4kHz 8kHz 16kHz
extern const std::array<PresetEntry, 10> kPresetTable;
extern const std::array<const char*, 10> kBandLabels;

std::vector<double> get_preset_bands(Preset p);
// Case-insensitive; anything unknown (including "") is Flat.
Preset get_preset_by_name(const std::string& name);
std::string preset_id(Preset p);
std::vector<Preset> all_presets();

} // namespace peq
