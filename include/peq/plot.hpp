#pragma once
#include <string>
#include <vector>

namespace peq {

class SvgPlotter {
public:
    // Points are spaced evenly along x in index order.
    void lineplot(const std::string& path,
                  double width, double height,
                  const std::vector<double>& y) const;
};

} // namespace peq
