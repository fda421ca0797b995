#pragma once
#include "ImageRecord.hpp"
#include "MapManager.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace ddloc {

struct Correspondence {
    int keypointIndex = -1;
    PointId pointId = -1;
    cv::Point2f pixel; // detected keypoint location
};

// Recovers which detected keypoints of a training image belong to known reconstruction points.
class KeypointAssigner {
public:
    explicit KeypointAssigner(double maxPixelDistance = 5.0);

    // For every ground-truth projection find the nearest detected keypoint; accept it when the
    // pixel distance is strictly below the threshold. A keypoint keeps only the first accepted
    // observation in traversal order. Result is sorted by ascending keypoint index.
    std::vector<Correspondence> assign(const std::vector<PointObservation> &observations,
                                       const std::vector<cv::Point2f> &keypoints) const;

    // Fills missing observation pixels by projecting the map points with the record's pose.
    // Observations whose point is unknown to the map are dropped, as are reprojections that land
    // behind the camera or outside the image.
    static std::vector<PointObservation> resolveObservations(const ImageRecord &record, const MapManager &map);

    double maxPixelDistance() const { return maxPixelDistance_; }
private:
    double maxPixelDistance_;
};

} // namespace ddloc
