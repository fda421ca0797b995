#pragma once
#include "MapPoint.hpp"
#include <vector>
#include <unordered_map>
#include <opencv2/core.hpp>

namespace ddloc {

// Read-mostly table of reconstruction points keyed by external point id.
// Points live in a dense arena; mpid2idx_ maps the external id to the arena slot.
class MapManager {
public:
    MapManager();

    // Appends points; an id that is already present is overwritten in place.
    void addMapPoints(const std::vector<MapPoint> &pts);

    const std::vector<MapPoint>& mappoints() const { return mappoints_; }
    size_t size() const { return mappoints_.size(); }

    // Lookup mappoint index by id (-1 if not found)
    int mapPointIndex(PointId id) const;
    bool contains(PointId id) const { return mapPointIndex(id) >= 0; }
    // Throws std::out_of_range for unknown ids.
    const cv::Point3d& position(PointId id) const;

    // Radius outlier removal: drops points with fewer than minNeighbors points
    // (itself included) inside a sphere of the given radius. Returns the number removed.
    int cullIsolatedPoints(double radius, int minNeighbors);

private:
    void rebuildIndex();

    std::vector<MapPoint> mappoints_;
    std::unordered_map<PointId,int> mpid2idx_;
};

} // namespace ddloc
