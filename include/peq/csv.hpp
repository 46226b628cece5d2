#pragma once
#include <string>
#include <vector>

namespace peq {

class CsvWriter {
public:
    // One row per frame: t,in_l,in_r,out_l,out_r
    void write(const std::string& path, int sample_rate,
               const std::vector<float>& in,
               const std::vector<float>& out) const;
};

} // namespace peq
