#pragma once
#include "Camera.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ddloc {

struct PoseEstimatorOptions {
    double reproj_threshold_px = 12.0; // RANSAC inlier threshold
    int max_iterations = 10000;
    double confidence = 0.9999;
    int min_inliers = 4;               // accepted pose must keep at least this many inliers
    bool refine = true;                // Levenberg-Marquardt over inliers after RANSAC
};

enum class PoseStatus { Success, InsufficientCorrespondences, Failed };

// Robust absolute pose from 2D-3D correspondences: minimal solver inside RANSAC,
// then non-linear refinement over the inliers.
class PoseEstimator {
public:
    static constexpr int kMinimalSampleSize = 4;

    explicit PoseEstimator(const PoseEstimatorOptions &options = PoseEstimatorOptions());

    // On success R (3x3) and t (3x1) hold the world-to-camera pose (CV_64F), mask has one
    // entry per correspondence (1 = inlier). failure receives a short reason otherwise.
    PoseStatus estimate(const std::vector<cv::Point2f> &pixels,
                        const std::vector<cv::Point3d> &world,
                        const CameraModel &camera,
                        cv::Mat &R, cv::Mat &t, std::vector<uchar> &mask, int &inliers,
                        std::string *failure = nullptr) const;

    // Mean reprojection error (px) over the masked correspondences.
    static double meanReprojectionError(const std::vector<cv::Point2f> &pixels,
                                        const std::vector<cv::Point3d> &world,
                                        const CameraModel &camera,
                                        const cv::Mat &R, const cv::Mat &t,
                                        const std::vector<uchar> &mask);

    const PoseEstimatorOptions& options() const { return options_; }
private:
    PoseEstimatorOptions options_;
};

} // namespace ddloc
