#pragma once
#include "Camera.hpp"
#include "ImageRecord.hpp"
#include "MapPoint.hpp"
#include <opencv2/calib3d.hpp>
#include <opencv2/core.hpp>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Shared helpers of the test programs: a failure counter and a synthetic scene generator.
namespace testutil {

inline int& failures(){
    static int n = 0;
    return n;
}

inline void check(bool cond, const std::string &what){
    if(cond){
        std::cout << "  ok: " << what << std::endl;
    } else {
        std::cerr << "  FAILED: " << what << std::endl;
        ++failures();
    }
}

template <typename Fn>
bool throws(Fn fn){
    try{
        fn();
    } catch(const std::exception &){
        return true;
    }
    return false;
}

inline int finish(const std::string &suite){
    if(failures() == 0){
        std::cout << "\n=== " << suite << ": all checks passed ===" << std::endl;
        return 0;
    }
    std::cerr << "\n=== " << suite << ": " << failures() << " check(s) failed ===" << std::endl;
    return 1;
}

inline ddloc::CameraModel pinhole(){
    return ddloc::CameraModel::fromParams("PINHOLE", 640, 480, {500.0, 500.0, 320.0, 240.0});
}

inline cv::Mat rotation(double rx, double ry, double rz){
    cv::Mat rvec = (cv::Mat_<double>(3,1) << rx, ry, rz);
    cv::Mat R;
    cv::Rodrigues(rvec, R);
    return R;
}

inline cv::Mat translation(double x, double y, double z){
    return (cv::Mat_<double>(3,1) << x, y, z);
}

// Points in front of a camera at the origin, each with a random appearance signature.
struct SyntheticScene {
    ddloc::CameraModel camera;
    std::vector<ddloc::MapPoint> points;
    cv::Mat signatures; // one CV_32F row per point
    cv::Mat globalBase; // 1 x globalDim, CV_32F
};

inline SyntheticScene makeScene(int numPoints, int dim, int globalDim, uint64 seed = 7){
    cv::RNG rng(seed);
    SyntheticScene s;
    s.camera = pinhole();
    for(int i=0;i<numPoints;++i){
        // sparse, non-contiguous ids
        s.points.emplace_back(1000 + 7*i, cv::Point3d(rng.uniform(-2.0, 2.0), rng.uniform(-1.5, 1.5), rng.uniform(4.0, 8.0)));
    }
    s.signatures.create(numPoints, dim, CV_32F);
    rng.fill(s.signatures, cv::RNG::UNIFORM, 0.0, 1.0);
    s.globalBase.create(1, globalDim, CV_32F);
    rng.fill(s.globalBase, cv::RNG::UNIFORM, 0.0, 1.0);
    return s;
}

struct ImageOptions {
    double pixelNoise = 0.0;  // uniform, per coordinate
    double descNoise = 0.0;   // uniform, per element
    double globalNoise = 0.0; // uniform, per element
    int distractors = 0;      // extra keypoints with random descriptors
    bool observations = true; // emit ground-truth observations
};

// Renders the scene from a world-to-camera pose: one keypoint per point, in point order,
// followed by the distractors.
inline ddloc::ImageRecord makeImage(const SyntheticScene &s, const std::string &name,
                                    const cv::Mat &R, const cv::Mat &t,
                                    cv::RNG &rng, const ImageOptions &opt = ImageOptions()){
    ddloc::ImageRecord rec;
    rec.name = name;
    rec.camera = s.camera;
    rec.R_cw = R.clone();
    rec.t_cw = t.clone();

    std::vector<cv::Point3d> world;
    for(const auto &mp: s.points) world.push_back(mp.p);
    std::vector<cv::Point2f> uv = s.camera.project(world, R, t);

    const int n = static_cast<int>(uv.size());
    rec.desc.create(n + opt.distractors, s.signatures.cols, CV_32F);
    for(int i=0;i<n;++i){
        cv::Point2f kp = uv[i];
        if(opt.pixelNoise > 0){
            kp.x += static_cast<float>(rng.uniform(-opt.pixelNoise, opt.pixelNoise));
            kp.y += static_cast<float>(rng.uniform(-opt.pixelNoise, opt.pixelNoise));
        }
        rec.kps.push_back(kp);
        cv::Mat row = rec.desc.row(i);
        s.signatures.row(i).copyTo(row);
        for(int c=0;c<row.cols && opt.descNoise > 0;++c)
            row.at<float>(0,c) += static_cast<float>(rng.uniform(-opt.descNoise, opt.descNoise));
        if(opt.observations){
            ddloc::PointObservation ob;
            ob.pointId = s.points[i].id;
            ob.pixel = uv[i];
            rec.observations.push_back(ob);
        }
    }
    for(int d=0;d<opt.distractors;++d){
        rec.kps.emplace_back(static_cast<float>(rng.uniform(0.0, 640.0)), static_cast<float>(rng.uniform(0.0, 480.0)));
        cv::Mat row = rec.desc.row(n + d);
        rng.fill(row, cv::RNG::UNIFORM, 0.0, 1.0);
    }

    rec.globalDesc = s.globalBase.clone();
    for(int c=0;c<rec.globalDesc.cols && opt.globalNoise > 0;++c)
        rec.globalDesc.at<float>(0,c) += static_cast<float>(rng.uniform(-opt.globalNoise, opt.globalNoise));
    return rec;
}

} // namespace testutil
