#include <colorkit/contrast/contour.h>

#include <colorkit/color/math.h>

namespace colorkit::detail {

namespace {

constexpr size_t kNoNode = static_cast<size_t>(-1);

// Edge nodes: the horizontal edge (i,j)-(i,j+1) is 2*(i*cols+j), the vertical
// edge (i,j)-(i+1,j) is 2*(i*cols+j)+1.
size_t horizontal_node(const ContourGrid& grid, int i, int j) {
    return 2 * grid.index(i, j);
}

size_t vertical_node(const ContourGrid& grid, int i, int j) {
    return 2 * grid.index(i, j) + 1;
}

RegionPoint crossing_point(const ContourGrid& grid, size_t node,
                           EdgeInterpolation interpolation) {
    const size_t cell = node / 2;
    const size_t cols = static_cast<size_t>(grid.cols());
    const int i0 = static_cast<int>(cell / cols);
    const int j0 = static_cast<int>(cell % cols);
    const bool vertical = (node % 2) == 1;
    const int i1 = vertical ? i0 + 1 : i0;
    const int j1 = vertical ? j0 : j0 + 1;

    double t = 0.5;
    if (interpolation == EdgeInterpolation::Linear) {
        const double v0 = grid.value(i0, j0);
        const double v1 = grid.value(i1, j1);
        const double denom = v0 - v1;
        t = denom != 0 ? clamp(v0 / denom, 0, 1) : 0.5;
    }
    return {
        lerp(grid.lightness(i0), grid.lightness(i1), t),
        lerp(grid.chroma(i0, j0), grid.chroma(i1, j1), t),
    };
}

struct Crossing {
    size_t node;
    bool exits;  // pass -> fail going counter-clockwise
};

struct Segment {
    size_t from;
    size_t to;
};

// Oriented segments of one cell, appended in counter-clockwise order.
void march_cell(const ContourGrid& grid, int i, int j, std::vector<Segment>& out) {
    struct Corner {
        int i;
        int j;
    };
    // a, b, c, d counter-clockwise with chroma as x and lightness as y
    const Corner corners[4] = {{i, j}, {i, j + 1}, {i + 1, j + 1}, {i + 1, j}};
    const size_t edges[4] = {
        horizontal_node(grid, i, j),      // a-b
        vertical_node(grid, i, j + 1),    // b-c
        horizontal_node(grid, i + 1, j),  // c-d
        vertical_node(grid, i, j),        // d-a
    };

    Crossing crossings[4];
    int count = 0;
    for (int k = 0; k < 4; ++k) {
        const Corner& p = corners[k];
        const Corner& q = corners[(k + 1) % 4];
        const bool p_pass = grid.passes(p.i, p.j);
        const bool q_pass = grid.passes(q.i, q.j);
        if (p_pass != q_pass) {
            crossings[count++] = {edges[k], p_pass};
        }
    }

    if (count == 2) {
        const Crossing& exit = crossings[0].exits ? crossings[0] : crossings[1];
        const Crossing& entry = crossings[0].exits ? crossings[1] : crossings[0];
        out.push_back({exit.node, entry.node});
        return;
    }
    if (count != 4) return;

    // Saddle: a passing center joins the passing corners, so each exit runs
    // to the next entry; otherwise it runs to the previous one.
    double center = 0;
    for (const Corner& corner : corners) {
        center += grid.value(corner.i, corner.j);
    }
    center /= 4;
    const bool center_passes = center >= 0;

    for (int k = 0; k < 4; ++k) {
        if (!crossings[k].exits) continue;
        const int partner = center_passes ? (k + 1) % 4 : (k + 3) % 4;
        out.push_back({crossings[k].node, crossings[partner].node});
    }
}

} // namespace

ContourGrid::ContourGrid(int rows, int cols) : rows_(rows), cols_(cols) {
    l_.resize(static_cast<size_t>(rows));
    c_.resize(static_cast<size_t>(rows) * static_cast<size_t>(cols));
    v_.resize(static_cast<size_t>(rows) * static_cast<size_t>(cols));
}

std::vector<RegionPath> trace_contours(const ContourGrid& grid,
                                       EdgeInterpolation interpolation) {
    std::vector<Segment> segments;
    for (int i = 0; i + 1 < grid.rows(); ++i) {
        for (int j = 0; j + 1 < grid.cols(); ++j) {
            march_cell(grid, i, j, segments);
        }
    }

    const size_t node_count = 2 * static_cast<size_t>(grid.rows()) *
                              static_cast<size_t>(grid.cols());
    std::vector<size_t> next(node_count, kNoNode);
    std::vector<size_t> prev(node_count, kNoNode);
    for (const Segment& seg : segments) {
        next[seg.from] = seg.to;
        prev[seg.to] = seg.from;
    }

    std::vector<RegionPath> paths;
    std::vector<bool> visited(node_count, false);
    for (const Segment& seg : segments) {
        if (visited[seg.from]) continue;

        // Back up to the head of an open chain; a loop starts here.
        size_t start = seg.from;
        while (prev[start] != kNoNode && prev[start] != seg.from) {
            start = prev[start];
        }
        if (prev[start] == seg.from) {
            start = seg.from;
        }

        RegionPath path;
        size_t node = start;
        do {
            visited[node] = true;
            path.push_back(crossing_point(grid, node, interpolation));
            node = next[node];
        } while (node != kNoNode && node != start);
        if (node == start) {
            path.push_back(path.front());
        }
        paths.push_back(std::move(path));
    }
    return paths;
}

} // namespace colorkit::detail
