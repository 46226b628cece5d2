#pragma once
#include "peq/equalizer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace peq {

struct Args {
    std::string source;
    std::string outdir = "out";
    std::string preset = "flat";
    std::vector<double> gains;
    int rate = 0;              // 0: take it from the file
    std::size_t block = 1024;  // frames per process() call
    bool disable = false;
    bool no_download = false;
    bool list_presets = false;
};

// Feeds `in` through `eq` the way an audio callback would, `block_frames`
// stereo frames at a time, and returns the concatenated output.
std::vector<float> render_in_blocks(dsp::EqualizerProcessor& eq,
                                    const std::vector<float>& in,
                                    std::size_t block_frames);

class App {
public:
    int run(int argc, char** argv);
private:
    static void usage(const char* prog);
    static Args parse_args(int argc, char** argv);
    static void list_presets();
};

} // namespace peq
