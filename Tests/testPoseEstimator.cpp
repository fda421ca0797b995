#include "PoseEstimator.hpp"
#include "PoseEvaluator.hpp"
#include "TestCommon.hpp"
#include <iostream>

using namespace ddloc;
using testutil::check;

int main() {
    std::cout << "=== Testing PoseEstimator ===" << std::endl;

    testutil::SyntheticScene scene = testutil::makeScene(30, 4, 4);
    std::vector<cv::Point3d> world;
    for(const auto &mp: scene.points) world.push_back(mp.p);
    cv::Mat R_gt = testutil::rotation(0.05, -0.1, 0.02);
    cv::Mat t_gt = testutil::translation(0.3, -0.1, 0.5);
    std::vector<cv::Point2f> pixels = scene.camera.project(world, R_gt, t_gt);
    PoseEstimator estimator;

    std::cout << "\n--- Test 1: too few correspondences ---" << std::endl;
    {
        std::vector<cv::Point2f> px(pixels.begin(), pixels.begin() + 2);
        std::vector<cv::Point3d> w(world.begin(), world.begin() + 2);
        cv::Mat R, t; std::vector<uchar> mask; int inliers = -1; std::string why;
        PoseStatus st = estimator.estimate(px, w, scene.camera, R, t, mask, inliers, &why);
        check(st == PoseStatus::InsufficientCorrespondences, "two correspondences: insufficient");
        check(R.empty() && inliers == 0 && !why.empty(), "no pose, reason given");
    }

    std::cout << "\n--- Test 2: noiseless correspondences ---" << std::endl;
    {
        cv::Mat R, t; std::vector<uchar> mask; int inliers = 0;
        PoseStatus st = estimator.estimate(pixels, world, scene.camera, R, t, mask, inliers);
        check(st == PoseStatus::Success, "pose found");
        if(st == PoseStatus::Success){
            PoseError err = PoseEvaluator::compare(R, t, R_gt, t_gt);
            std::cout << "  translation error " << err.translation << ", rotation error " << err.rotationDeg << " deg" << std::endl;
            check(err.translation < 1e-4 && err.rotationDeg < 1e-3, "ground truth recovered");
            check(inliers == 30, "all correspondences are inliers");
            check(R.type() == CV_64F && t.rows == 3 && t.cols == 1, "R 3x3 and t 3x1 in double");
            double reproj = PoseEstimator::meanReprojectionError(pixels, world, scene.camera, R, t, mask);
            check(reproj < 1e-2, "sub-pixel reprojection error");
        }
    }

    std::cout << "\n--- Test 3: gross outliers ---" << std::endl;
    {
        std::vector<cv::Point2f> px = pixels;
        for(int i=0;i<9;++i) px[3*i+1].x += 80.f; // 9 of 30 moved far outside the threshold
        cv::Mat R, t; std::vector<uchar> mask; int inliers = 0;
        PoseStatus st = estimator.estimate(px, world, scene.camera, R, t, mask, inliers);
        check(st == PoseStatus::Success, "pose found despite 30% outliers");
        if(st == PoseStatus::Success){
            PoseError err = PoseEvaluator::compare(R, t, R_gt, t_gt);
            check(err.translation < 1e-3 && err.rotationDeg < 1e-2, "ground truth recovered");
            check(inliers == 21, "exactly the untouched correspondences are inliers");
            bool outliersRejected = true;
            for(int i=0;i<9;++i) outliersRejected = outliersRejected && mask[3*i+1] == 0;
            check(outliersRejected, "moved correspondences are outliers");
        }
    }

    std::cout << "\n--- Test 4: options ---" << std::endl;
    {
        PoseEstimatorOptions bad; bad.reproj_threshold_px = 0.0;
        check(testutil::throws([&]{ PoseEstimator p(bad); }), "non-positive threshold rejected");
        PoseEstimatorOptions low; low.min_inliers = 1;
        check(PoseEstimator(low).options().min_inliers == PoseEstimator::kMinimalSampleSize, "inlier floor is the minimal sample");
        cv::Mat R, t; std::vector<uchar> mask; int inliers = 0;
        check(testutil::throws([&]{ estimator.estimate(pixels, world, CameraModel(), R, t, mask, inliers); }), "uncalibrated camera rejected");
    }

    return testutil::finish("PoseEstimator");
}
