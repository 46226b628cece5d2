#include "peq/app.hpp"
#include "peq/util.hpp"
#include "peq/http.hpp"
#include "peq/h5.hpp"
#include "peq/presets.hpp"
#include "peq/plot.hpp"
#include "peq/csv.hpp"

#include <H5Cpp.h>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace peq {

std::vector<float> render_in_blocks(dsp::EqualizerProcessor& eq,
                                    const std::vector<float>& in,
                                    std::size_t block_frames)
{
    const std::size_t frames = std::min(std::max<std::size_t>(1, block_frames), in.size() / 2 + 1);
    const std::size_t step = frames * 2;
    std::vector<float> out;
    out.reserve(in.size());
    dsp::Buffer block;
    for (std::size_t off = 0; off < in.size(); off += step) {
        const std::size_t end = std::min(in.size(), off + step);
        block.assign(in.begin() + off, in.begin() + end);
        const dsp::Buffer& y = eq.process(block);
        out.insert(out.end(), y.begin(), y.end());
    }
    return out;
}

static std::vector<double> left_channel(const std::vector<float>& s) {
    std::vector<double> l;
    l.reserve(s.size() / 2);
    for (size_t i=0; i+1<s.size(); i+=2) l.push_back(s[i]);
    return l;
}

void App::usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " <url_or_hdf5_path> [--out outdir] [--preset name] [--gains g0,g1,...]\n"
        "      [--rate hz] [--block frames] [--disable] [--no-download]\n"
        "  " << prog << " --list-presets\n\n"
        "Examples:\n"
        "  " << prog << " song.h5 --preset rock\n"
        "  " << prog << " song.h5 --preset bass_boost --gains 10,9 --block 512\n";
}

Args App::parse_args(int argc, char** argv) {
    if (argc < 2) { usage(argv[0]); std::exit(1); }
    Args a;
    for (int i=1; i<argc; ++i) {
        std::string k = argv[i];
        if (k=="--out" && i+1<argc) { a.outdir = argv[++i]; }
        else if (k=="--preset" && i+1<argc) { a.preset = argv[++i]; }
        else if (k=="--gains" && i+1<argc) { a.gains = parse_double_list(argv[++i]); }
        else if (k=="--rate" && i+1<argc) { a.rate = std::stoi(argv[++i]); }
        else if (k=="--block" && i+1<argc) { a.block = std::stoul(argv[++i]); }
        else if (k=="--disable") { a.disable = true; }
        else if (k=="--no-download") { a.no_download = true; }
        else if (k=="--list-presets") { a.list_presets = true; }
        else if (!k.empty() && k[0] != '-' && a.source.empty()) { a.source = k; }
        else { std::cerr << "Unknown arg: " << k << "\n"; usage(argv[0]); std::exit(1); }
    }
    if (a.source.empty() && !a.list_presets) { usage(argv[0]); std::exit(1); }
    if (a.rate < 0) throw std::invalid_argument("--rate must be positive");
    if (a.block == 0) throw std::invalid_argument("--block must be at least 1");
    if (a.block > std::numeric_limits<std::size_t>::max() / 2) throw std::out_of_range("--block is too large");
    return a;
}

void App::list_presets() {
    std::cout << std::left << std::setw(12) << "preset";
    for (const char* l : kBandLabels) std::cout << std::right << std::setw(7) << l;
    std::cout << "\n";
    for (Preset p : all_presets()) {
        std::cout << std::left << std::setw(12) << preset_id(p);
        for (double g : get_preset_bands(p)) std::cout << std::right << std::setw(7) << g;
        std::cout << "\n";
    }
}

int App::run(int argc, char** argv) {
    try {
        Args args = parse_args(argc, argv);
        if (args.list_presets) { list_presets(); return 0; }

        std::string h5path = args.source;
        if (is_http_url(args.source)) {
            if (args.no_download) {
                std::cerr << "URL provided with --no-download. Nothing to do.\n";
                return 1;
            }
            HttpClient http;
            h5path = http.download_to(args.source, args.outdir);
        }

        H5PcmReader reader;
        StereoSeries in = reader.read(h5path);
        if (args.rate > 0) in.sample_rate = args.rate;
        if (in.sample_rate <= 0) throw std::runtime_error("invalid sample rate in: " + h5path);

        std::cout << "Dataset: " << in.datasetPath << "\n"
                  << "Frames: " << in.frames()
                  << ", fs = " << in.sample_rate << " Hz\n";

        dsp::EqualizerProcessor eq(in.sample_rate);

        const Preset preset = get_preset_by_name(args.preset);
        if (preset_id(preset) != to_lower(args.preset)) {
            std::cerr << "Unknown preset '" << args.preset << "', using flat\n";
        }
        eq.set_bands(get_preset_bands(preset));
        if (args.gains.size() > dsp::kNumBands) {
            std::cerr << "Warning: only the first " << dsp::kNumBands << " gains are used\n";
        }
        eq.set_bands(args.gains);
        eq.set_enabled(!args.disable);

        const auto gains = eq.gains();
        std::cout << "EQ " << (eq.enabled() ? "on" : "off") << ", preset " << preset_id(preset) << ":";
        for (size_t i=0; i<dsp::kNumBands; ++i) {
            std::cout << " " << kBandLabels[i] << "=" << gains[i];
            if (gains[i] != 0.0 && !dsp::band_within_nyquist(in.sample_rate, dsp::kBandFrequencies[i])) {
                std::cerr << "Warning: " << kBandLabels[i] << " is above Nyquist at "
                          << in.sample_rate << " Hz\n";
            }
        }
        std::cout << "\n";

        ensure_dir(args.outdir);

        StereoSeries out;
        out.sample_rate = in.sample_rate;
        out.datasetPath = "/pcm";
        out.samples = render_in_blocks(eq, in.samples, args.block);

        H5PcmWriter writer;
        writer.write(args.outdir + "/equalized.h5", out);

        CsvWriter csv;
        csv.write(args.outdir + "/trace.csv", in.sample_rate, in.samples, out.samples);

        SvgPlotter plot;
        plot.lineplot(args.outdir + "/input.svg",  1200, 400, left_channel(in.samples));
        plot.lineplot(args.outdir + "/output.svg", 1200, 400, left_channel(out.samples));
        const double fmax = std::min(20000.0, in.sample_rate / 2.0 * 0.999);
        plot.lineplot(args.outdir + "/response.svg", 1200, 400, eq.frequency_response(512, 20.0, fmax));

        std::cout << "Done. See " << args.outdir << "/output.svg and /response.svg\n";
        return 0;
    } catch (const H5::Exception& e) {
        std::cerr << "Error: HDF5: " << e.getDetailMsg() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}

} // namespace peq
