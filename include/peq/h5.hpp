#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace peq {

// Interleaved stereo PCM [L0,R0,L1,R1,...].
struct StereoSeries {
    std::vector<float> samples;
    int sample_rate = 44100;
    std::string datasetPath;

    std::size_t frames() const { return samples.size() / 2; }
};

class H5PcmReader {
public:
    StereoSeries read(const std::string& h5file) const;
};

class H5PcmWriter {
public:
    // Writes dataset "/pcm" as [frames][2] float with a SampleRate attribute.
    void write(const std::string& h5file, const StereoSeries& s) const;
};

} // namespace peq
