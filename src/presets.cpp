#include "peq/presets.hpp"
#include "peq/util.hpp"

namespace peq {

const std::array<PresetEntry, 10> kPresetTable = {{
    {Preset::Flat,       "flat",       { 0,  0,  0,  0,  0,  0,  0,  0,  0,  0}},
    {Preset::Rock,       "rock",       { 5,  4,  3,  1, -1,  0,  2,  4,  5,  5}},
    {Preset::Pop,        "pop",        {-2, -1,  0,  2,  4,  4,  3,  1,  0, -1}},
    {Preset::Jazz,       "jazz",       { 3,  2,  1,  2, -1,  0,  1,  2,  3,  4}},
    {Preset::Classical,  "classical",  { 0,  0,  0,  0,  0,  0, -1,  2,  3,  4}},
    {Preset::Electronic, "electronic", { 6,  5,  2,  0, -2,  0,  1,  3,  5,  6}},
    {Preset::HipHop,     "hip_hop",    { 7,  6,  4,  2,  1,  0,  1,  2,  2,  3}},
    {Preset::Acoustic,   "acoustic",   { 3,  2,  1,  1,  2,  1,  2,  3,  2,  2}},
    {Preset::Vocal,      "vocal",      {-3, -2,  0,  3,  5,  5,  4,  2,  0, -2}},
    {Preset::BassBoost,  "bass_boost", { 8,  7,  5,  2,  0,  0,  0,  0,  0,  0}},
}};

const std::array<const char*, 10> kBandLabels = {
    "31Hz", "62Hz", "125Hz", "250Hz", "500Hz",
    "1kHz", "2kHz", "4kHz", "8kHz", "16kHz"
};

static const PresetEntry& entry(Preset p) {
    for (const auto& e : kPresetTable) {
        if (e.preset == p) return e;
    }
    return kPresetTable.front();
}

std::vector<double> get_preset_bands(Preset p) {
    const auto& g = entry(p).gains;
    return std::vector<double>(g.begin(), g.end());
}

Preset get_preset_by_name(const std::string& name) {
    const std::string key = to_lower(name);
    for (const auto& e : kPresetTable) {
        if (key == e.id) return e.preset;
    }
    return Preset::Flat;
}

std::string preset_id(Preset p) { return entry(p).id; }

std::vector<Preset> all_presets() {
    std::vector<Preset> out;
    out.reserve(kPresetTable.size());
    for (const auto& e : kPresetTable) out.push_back(e.preset);
    return out;
}

} // namespace peq
