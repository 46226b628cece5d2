#include "peq/h5.hpp"

#include <H5Cpp.h>
#include <hdf5.h>
#include <H5Epublic.h>
#include <H5Lpublic.h>

#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace peq {

static bool dataset_exists(H5::H5File& f, const std::string& path) {
    H5E_auto2_t old_func;
    void* old_client;
    H5Eget_auto2(H5E_DEFAULT, &old_func, &old_client);
    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    const htri_t ex = H5Lexists(f.getId(), path.c_str(), H5P_DEFAULT);
    H5Eset_auto2(H5E_DEFAULT, old_func, old_client);
    return ex > 0;
}

static std::optional<double> try_attr_number(H5::DataSet& ds, const char* name) {
    if (H5Aexists(ds.getId(), name) <= 0) return std::nullopt;
    auto a = ds.openAttribute(name);
    const H5T_class_t cls = a.getTypeClass();
    if (cls == H5T_FLOAT) { double v=0; a.read(H5::PredType::NATIVE_DOUBLE, &v); return v; }
    if (cls == H5T_INTEGER) { long long v=0; a.read(H5::PredType::NATIVE_LLONG, &v); return static_cast<double>(v); }
    return std::nullopt;
}

StereoSeries H5PcmReader::read(const std::string& h5file) const {
    H5::Exception::dontPrint();
    H5::H5File f(h5file, H5F_ACC_RDONLY);

    const std::vector<std::string> candidates = {
        "/pcm", "pcm",
        "/audio", "audio",
        "/samples", "samples"
    };

    H5::DataSet ds;
    std::string used;
    bool found = false;
    for (const auto& c : candidates) {
        if (dataset_exists(f, c)) {
            ds = f.openDataSet(c);
            used = c;
            found = true;
            break;
        }
    }
    if (!found) throw std::runtime_error("no pcm dataset found in: " + h5file);

    H5::DataSpace sp = ds.getSpace();
    const int rank = sp.getSimpleExtentNdims();
    hsize_t dims[2] = {0, 0};
    if (rank == 1) {
        sp.getSimpleExtentDims(dims, nullptr);
    } else if (rank == 2) {
        sp.getSimpleExtentDims(dims, nullptr);
        if (dims[1] != 2) throw std::runtime_error("pcm dataset is not [frames][2]: " + used);
        dims[0] *= 2;
    } else {
        throw std::runtime_error("pcm dataset must be 1D interleaved or [frames][2]");
    }

    StereoSeries out;
    out.samples.resize(static_cast<size_t>(dims[0]));
    ds.read(out.samples.data(), H5::PredType::NATIVE_FLOAT);
    out.datasetPath = used;

    auto rate = try_attr_number(ds, "SampleRate");
    if (!rate || !(*rate > 0)) rate = try_attr_number(ds, "SamplingRate");
    if (rate && *rate > 0) {
        if (*rate > std::numeric_limits<int>::max()) {
            throw std::runtime_error("sample rate out of range in: " + used);
        }
        out.sample_rate = static_cast<int>(*rate);
    }

    if (out.samples.size() % 2 != 0) {
        std::cerr << "Warning: odd sample count in " << used << ", last sample passes through\n";
    }
    return out;
}

void H5PcmWriter::write(const std::string& h5file, const StereoSeries& s) const {
    H5::Exception::dontPrint();
    H5::H5File f(h5file, H5F_ACC_TRUNC);

    const bool paired = s.samples.size() % 2 == 0;
    const hsize_t dims[2] = {paired ? s.frames() : s.samples.size(), 2};
    H5::DataSpace sp(paired ? 2 : 1, dims);
    H5::DataSet ds = f.createDataSet("pcm", H5::PredType::IEEE_F32LE, sp);
    ds.write(s.samples.data(), H5::PredType::NATIVE_FLOAT);

    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute a = ds.createAttribute("SampleRate", H5::PredType::NATIVE_INT, scalar);
    a.write(H5::PredType::NATIVE_INT, &s.sample_rate);

    std::cout << "✓ HDF5: " << h5file << "\n";
}

} // namespace peq
