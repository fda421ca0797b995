#include "Camera.hpp"
#include <opencv2/calib3d.hpp>
#include <stdexcept>

namespace ddloc {

int CameraModel::numParams(const std::string &model){
    if(model == "SIMPLE_PINHOLE") return 3;
    if(model == "PINHOLE") return 4;
    if(model == "SIMPLE_RADIAL") return 4;
    if(model == "RADIAL") return 5;
    if(model == "OPENCV") return 8;
    if(model == "FULL_OPENCV") return 12;
    return -1;
}

CameraModel CameraModel::fromParams(const std::string &model, int width, int height,
                                    const std::vector<double> &params){
    int expected = numParams(model);
    if(expected < 0) throw std::invalid_argument("CameraModel: unknown camera model '" + model + "'");
    if(static_cast<int>(params.size()) != expected){
        throw std::invalid_argument("CameraModel: " + model + " expects " + std::to_string(expected) +
                                    " parameters, got " + std::to_string(params.size()));
    }

    CameraModel cam;
    cam.model_ = model; cam.width_ = width; cam.height_ = height; cam.params_ = params;
    const auto &p = params;
    if(model == "SIMPLE_PINHOLE" || model == "SIMPLE_RADIAL" || model == "RADIAL"){
        cam.fx_ = cam.fy_ = p[0]; cam.cx_ = p[1]; cam.cy_ = p[2];
    } else {
        cam.fx_ = p[0]; cam.fy_ = p[1]; cam.cx_ = p[2]; cam.cy_ = p[3];
    }

    if(model == "SIMPLE_PINHOLE" || model == "PINHOLE"){
        cam.dist_ = cv::Mat::zeros(4,1,CV_64F);
    } else if(model == "SIMPLE_RADIAL"){
        cam.dist_ = (cv::Mat_<double>(4,1) << p[3], 0, 0, 0);
    } else if(model == "RADIAL"){
        cam.dist_ = (cv::Mat_<double>(4,1) << p[3], p[4], 0, 0);
    } else if(model == "OPENCV"){
        cam.dist_ = (cv::Mat_<double>(4,1) << p[4], p[5], p[6], p[7]);
    } else {
        cam.dist_ = (cv::Mat_<double>(8,1) << p[4], p[5], p[6], p[7], p[8], p[9], p[10], p[11]);
    }
    return cam;
}

cv::Mat CameraModel::cameraMatrix() const {
    return (cv::Mat_<double>(3,3) << fx_,0,cx_, 0,fy_,cy_, 0,0,1);
}

cv::Mat CameraModel::distCoeffs() const {
    return dist_.empty() ? cv::Mat::zeros(4,1,CV_64F) : dist_.clone();
}

std::vector<cv::Point2f> CameraModel::project(const std::vector<cv::Point3d> &world,
                                              const cv::Mat &R, const cv::Mat &t) const {
    std::vector<cv::Point2f> out;
    if(world.empty()) return out;
    cv::Mat rvec; cv::Rodrigues(R, rvec);
    std::vector<cv::Point2d> proj;
    cv::projectPoints(world, rvec, t, cameraMatrix(), distCoeffs(), proj);
    out.reserve(proj.size());
    for(const auto &p: proj) out.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
    return out;
}

} // namespace ddloc
