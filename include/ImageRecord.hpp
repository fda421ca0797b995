#pragma once
#include "Camera.hpp"
#include "MapPoint.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ddloc {

// A reconstruction point seen by an image. pixel is the ground-truth projection;
// hasPixel == false means it must be re-projected from the image pose.
struct PointObservation {
    PointId pointId = -1;
    cv::Point2f pixel;
    bool hasPixel = true;
};

// One training or query image as handed over by a DataLoader.
struct ImageRecord {
    std::string name;
    CameraModel camera;

    // pose: world-to-camera, x_cam = R_cw * X_world + t_cw (empty when unknown)
    cv::Mat R_cw;
    cv::Mat t_cw;

    std::vector<PointObservation> observations; // training images only

    std::vector<cv::Point2f> kps; // detected keypoint pixels
    cv::Mat desc;                 // one local descriptor per keypoint (N x Dl)
    cv::Mat globalDesc;           // whole-image descriptor (1 x Dg), optional

    bool hasPose() const { return !R_cw.empty() && !t_cw.empty(); }
    bool hasLocalFeatures() const { return !desc.empty() && desc.rows == static_cast<int>(kps.size()); }
};

} // namespace ddloc
