#include "PoseEstimator.hpp"
#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ddloc {

PoseEstimator::PoseEstimator(const PoseEstimatorOptions &options)
    : options_(options)
{
    if(!(options_.reproj_threshold_px > 0.0)) throw std::invalid_argument("PoseEstimator: reprojection threshold must be positive");
    if(options_.max_iterations <= 0) throw std::invalid_argument("PoseEstimator: max_iterations must be positive");
    if(!(options_.confidence > 0.0 && options_.confidence < 1.0)) throw std::invalid_argument("PoseEstimator: confidence must lie in (0,1)");
    if(options_.min_inliers < kMinimalSampleSize) options_.min_inliers = kMinimalSampleSize;
}

PoseStatus PoseEstimator::estimate(const std::vector<cv::Point2f> &pixels,
                                   const std::vector<cv::Point3d> &world,
                                   const CameraModel &camera,
                                   cv::Mat &R, cv::Mat &t, std::vector<uchar> &mask, int &inliers,
                                   std::string *failure) const {
    R.release(); t.release(); mask.assign(pixels.size(), 0); inliers = 0;
    if(pixels.size() != world.size()) throw std::invalid_argument("PoseEstimator: pixel and world point counts differ");
    if(!camera.valid()) throw std::invalid_argument("PoseEstimator: camera model not set");
    if(pixels.size() < static_cast<size_t>(kMinimalSampleSize)){
        if(failure) *failure = "only " + std::to_string(pixels.size()) + " correspondences";
        return PoseStatus::InsufficientCorrespondences;
    }

    std::vector<cv::Point2d> uv(pixels.begin(), pixels.end());
    cv::Mat K = camera.cameraMatrix();
    cv::Mat dist = camera.distCoeffs();
    cv::Mat rvec, tvec;
    std::vector<int> inlierIdx;
    try{
        bool ok = cv::solvePnPRansac(world, uv, K, dist, rvec, tvec, false,
                                     options_.max_iterations, static_cast<float>(options_.reproj_threshold_px),
                                     options_.confidence, inlierIdx, cv::SOLVEPNP_EPNP);
        if(!ok || static_cast<int>(inlierIdx.size()) < kMinimalSampleSize){
            if(failure) *failure = "RANSAC found no consensus";
            return PoseStatus::Failed;
        }

        if(options_.refine){
            std::vector<cv::Point3d> objIn; std::vector<cv::Point2d> imgIn;
            objIn.reserve(inlierIdx.size()); imgIn.reserve(inlierIdx.size());
            for(int idx: inlierIdx){ objIn.push_back(world[idx]); imgIn.push_back(uv[idx]); }
            cv::solvePnPRefineLM(objIn, imgIn, K, dist, rvec, tvec);
        }
    } catch(const cv::Exception &e){
        if(failure) *failure = std::string("solver error: ") + e.what();
        return PoseStatus::Failed;
    }
    if(!cv::checkRange(rvec) || !cv::checkRange(tvec)){
        if(failure) *failure = "non-finite pose";
        return PoseStatus::Failed;
    }

    // inlier set under the final pose
    std::vector<cv::Point2d> proj;
    cv::projectPoints(world, rvec, tvec, K, dist, proj);
    const double th2 = options_.reproj_threshold_px * options_.reproj_threshold_px;
    for(size_t i=0;i<proj.size();++i){
        double dx = proj[i].x - uv[i].x, dy = proj[i].y - uv[i].y;
        if(dx*dx + dy*dy < th2){ mask[i] = 1; ++inliers; }
    }
    if(inliers < options_.min_inliers){
        if(failure) *failure = "only " + std::to_string(inliers) + " inliers";
        std::fill(mask.begin(), mask.end(), 0); inliers = 0;
        return PoseStatus::Failed;
    }

    cv::Rodrigues(rvec, R);
    R.convertTo(R, CV_64F);
    tvec.convertTo(t, CV_64F);
    t = t.reshape(1, 3);
    return PoseStatus::Success;
}

double PoseEstimator::meanReprojectionError(const std::vector<cv::Point2f> &pixels,
                                            const std::vector<cv::Point3d> &world,
                                            const CameraModel &camera,
                                            const cv::Mat &R, const cv::Mat &t,
                                            const std::vector<uchar> &mask){
    if(world.empty() || R.empty() || t.empty()) return 0.0;
    std::vector<cv::Point2f> proj = camera.project(world, R, t);
    double sum = 0.0; int n = 0;
    for(size_t i=0;i<proj.size();++i){
        if(i < mask.size() && !mask[i]) continue;
        sum += std::hypot(proj[i].x - pixels[i].x, proj[i].y - pixels[i].y);
        ++n;
    }
    return n > 0 ? sum / n : 0.0;
}

} // namespace ddloc
