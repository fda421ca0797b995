#pragma once
#include <opencv2/core.hpp>

namespace ddloc {

// Identity of a reconstruction point. Stable for the lifetime of a map; not necessarily contiguous.
using PointId = int;

struct MapPoint {
    PointId id = -1; // unique id for id-based lookups
    cv::Point3d p;   // 3D position in world frame

    MapPoint() = default;
    MapPoint(PointId id_, const cv::Point3d &pos) : id(id_), p(pos) {}
};

} // namespace ddloc
