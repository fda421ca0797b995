#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ddloc {

// Calibrated camera identified by a COLMAP model name and its ordered parameter vector.
// Supported models:
//   SIMPLE_PINHOLE  f, cx, cy
//   PINHOLE         fx, fy, cx, cy
//   SIMPLE_RADIAL   f, cx, cy, k
//   RADIAL          f, cx, cy, k1, k2
//   OPENCV          fx, fy, cx, cy, k1, k2, p1, p2
//   FULL_OPENCV     fx, fy, cx, cy, k1, k2, p1, p2, k3, k4, k5, k6
class CameraModel {
public:
    CameraModel() = default;

    // Throws std::invalid_argument on an unknown model name or a wrong parameter count.
    static CameraModel fromParams(const std::string &model, int width, int height,
                                  const std::vector<double> &params);

    const std::string& model() const { return model_; }
    int width() const { return width_; }
    int height() const { return height_; }
    const std::vector<double>& params() const { return params_; }
    bool valid() const { return !model_.empty(); }

    // 3x3 CV_64F intrinsic matrix
    cv::Mat cameraMatrix() const;
    // distortion coefficients in OpenCV order (k1,k2,p1,p2[,k3,k4,k5,k6]), CV_64F column
    cv::Mat distCoeffs() const;

    // Project world points with a world-to-camera pose (x_cam = R * X + t).
    std::vector<cv::Point2f> project(const std::vector<cv::Point3d> &world,
                                     const cv::Mat &R, const cv::Mat &t) const;

    // Number of parameters expected for a model name, -1 if unknown.
    static int numParams(const std::string &model);

private:
    std::string model_;
    int width_ = 0, height_ = 0;
    std::vector<double> params_;
    double fx_ = 0, fy_ = 0, cx_ = 0, cy_ = 0;
    cv::Mat dist_;
};

} // namespace ddloc
