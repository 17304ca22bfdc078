#pragma once
#include <colorkit/contrast/region_tracer.h>

#include <cstddef>
#include <vector>

namespace colorkit::detail {

// Scalar field over the lightness/chroma plane. Row i sits at one lightness;
// each sample carries its own chroma. A sample passes when its value is >= 0.
class ContourGrid {
public:
    ContourGrid(int rows, int cols);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    size_t index(int i, int j) const {
        return static_cast<size_t>(i) * static_cast<size_t>(cols_) +
               static_cast<size_t>(j);
    }

    double& row_lightness(int i) { return l_[static_cast<size_t>(i)]; }
    double lightness(int i) const { return l_[static_cast<size_t>(i)]; }
    double& chroma(int i, int j) { return c_[index(i, j)]; }
    double chroma(int i, int j) const { return c_[index(i, j)]; }
    double& value(int i, int j) { return v_[index(i, j)]; }
    double value(int i, int j) const { return v_[index(i, j)]; }
    bool passes(int i, int j) const { return value(i, j) >= 0; }

private:
    int rows_;
    int cols_;
    std::vector<double> l_;
    std::vector<double> c_;
    std::vector<double> v_;
};

// Marching squares over the grid. Paths keep passing samples on their left
// (x = chroma, y = lightness) and come out in row-major order of their first
// cell; closed loops repeat their first point. In a saddle cell the mean of
// the four corners decides: a passing mean joins the two passing corners.
std::vector<RegionPath> trace_contours(const ContourGrid& grid,
                                       EdgeInterpolation interpolation);

} // namespace colorkit::detail
