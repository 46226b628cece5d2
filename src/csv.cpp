#include "peq/csv.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace peq {

void CsvWriter::write(const std::string& path, int sample_rate,
                      const std::vector<float>& in,
                      const std::vector<float>& out) const
{
    std::ofstream f(path);
    if (!f) throw std::runtime_error("cannot open csv: " + path);
    f << "t,in_l,in_r,out_l,out_r\n";
    const double dt = 1.0 / sample_rate;
    const size_t n = std::min(in.size(), out.size()) / 2;
    for (size_t i=0; i<n; ++i) {
        f << (i*dt) << "," << in[2*i] << "," << in[2*i+1]
          << "," << out[2*i] << "," << out[2*i+1] << "\n";
    }
    std::cout << "✓ CSV: " << path << "\n";
}

} // namespace peq
