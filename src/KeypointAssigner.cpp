#include "KeypointAssigner.hpp"
#include <opencv2/flann.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace ddloc {

KeypointAssigner::KeypointAssigner(double maxPixelDistance)
    : maxPixelDistance_(maxPixelDistance)
{
    if(!(maxPixelDistance_ > 0.0)) throw std::invalid_argument("KeypointAssigner: pixel threshold must be positive");
}

std::vector<Correspondence> KeypointAssigner::assign(const std::vector<PointObservation> &observations,
                                                     const std::vector<cv::Point2f> &keypoints) const {
    std::vector<Correspondence> out;
    if(observations.empty() || keypoints.empty()) return out;

    cv::Mat kpMat(static_cast<int>(keypoints.size()), 2, CV_32F);
    for(int i=0;i<kpMat.rows;++i){
        kpMat.at<float>(i,0) = keypoints[i].x;
        kpMat.at<float>(i,1) = keypoints[i].y;
    }
    cv::Mat queries(static_cast<int>(observations.size()), 2, CV_32F);
    for(int i=0;i<queries.rows;++i){
        queries.at<float>(i,0) = observations[i].pixel.x;
        queries.at<float>(i,1) = observations[i].pixel.y;
    }

    // single tree + unlimited checks: exact nearest neighbour
    cv::flann::Index tree(kpMat, cv::flann::KDTreeIndexParams(1));
    cv::Mat nnIdx, nnDist;
    tree.knnSearch(queries, nnIdx, nnDist, 1, cv::flann::SearchParams(cvflann::FLANN_CHECKS_UNLIMITED));

    std::unordered_set<int> claimed;
    for(int i=0;i<queries.rows;++i){
        int k = nnIdx.at<int>(i,0);
        if(k < 0 || k >= kpMat.rows) continue;
        // distance re-evaluated in double so the threshold boundary is exact
        double dx = static_cast<double>(keypoints[k].x) - observations[i].pixel.x;
        double dy = static_cast<double>(keypoints[k].y) - observations[i].pixel.y;
        if(!(std::sqrt(dx*dx + dy*dy) < maxPixelDistance_)) continue;
        if(!claimed.insert(k).second) continue;
        Correspondence c;
        c.keypointIndex = k; c.pointId = observations[i].pointId; c.pixel = keypoints[k];
        out.push_back(c);
    }
    std::sort(out.begin(), out.end(), [](const Correspondence &a, const Correspondence &b){
        return a.keypointIndex < b.keypointIndex;
    });
    return out;
}

std::vector<PointObservation> KeypointAssigner::resolveObservations(const ImageRecord &record, const MapManager &map){
    std::vector<PointObservation> out; out.reserve(record.observations.size());
    std::vector<size_t> pending;
    std::vector<cv::Point3d> world;
    for(const auto &ob: record.observations){
        if(!map.contains(ob.pointId)) continue;
        if(!ob.hasPixel){
            if(!record.hasPose() || !record.camera.valid()) continue;
            pending.push_back(out.size());
            world.push_back(map.position(ob.pointId));
        }
        out.push_back(ob);
    }
    if(world.empty()) return out;

    cv::Mat R, t;
    record.R_cw.convertTo(R, CV_64F);
    record.t_cw.reshape(1, 3).convertTo(t, CV_64F);
    std::vector<cv::Point2f> uv = record.camera.project(world, R, t);
    const int w = record.camera.width(), h = record.camera.height();

    // reprojections behind the camera or outside the image cannot match a detection
    std::vector<bool> keep(out.size(), true);
    for(size_t i=0;i<pending.size();++i){
        cv::Mat Xc = R * (cv::Mat_<double>(3,1) << world[i].x, world[i].y, world[i].z) + t;
        const cv::Point2f &p = uv[i];
        bool inside = p.x >= 0.f && p.y >= 0.f && (w <= 0 || p.x < w) && (h <= 0 || p.y < h);
        if(!(Xc.at<double>(2) > 0.0) || !inside){
            keep[pending[i]] = false;
            continue;
        }
        out[pending[i]].pixel = p;
        out[pending[i]].hasPixel = true;
    }
    std::vector<PointObservation> visible; visible.reserve(out.size());
    for(size_t i=0;i<out.size();++i){
        if(keep[i]) visible.push_back(out[i]);
    }
    return visible;
}

} // namespace ddloc
