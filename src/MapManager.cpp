#include "MapManager.hpp"
#include <opencv2/flann.hpp>
#include <stdexcept>
#include <string>

namespace ddloc {

MapManager::MapManager() {}

void MapManager::addMapPoints(const std::vector<MapPoint> &pts){
    mappoints_.reserve(mappoints_.size() + pts.size());
    for(const auto &mp: pts){
        auto it = mpid2idx_.find(mp.id);
        if(it != mpid2idx_.end()){
            mappoints_[it->second] = mp;
            continue;
        }
        mpid2idx_[mp.id] = static_cast<int>(mappoints_.size());
        mappoints_.push_back(mp);
    }
}

int MapManager::mapPointIndex(PointId id) const {
    auto it = mpid2idx_.find(id);
    return it == mpid2idx_.end() ? -1 : it->second;
}

const cv::Point3d& MapManager::position(PointId id) const {
    int idx = mapPointIndex(id);
    if(idx < 0) throw std::out_of_range("MapManager: unknown point id " + std::to_string(id));
    return mappoints_[idx].p;
}

int MapManager::cullIsolatedPoints(double radius, int minNeighbors){
    if(radius <= 0.0 || minNeighbors <= 0) throw std::invalid_argument("MapManager: radius and minNeighbors must be positive");
    if(mappoints_.empty()) return 0;

    cv::Mat xyz(static_cast<int>(mappoints_.size()), 3, CV_32F);
    for(int i=0;i<xyz.rows;++i){
        const cv::Point3d &p = mappoints_[i].p;
        xyz.at<float>(i,0) = static_cast<float>(p.x);
        xyz.at<float>(i,1) = static_cast<float>(p.y);
        xyz.at<float>(i,2) = static_cast<float>(p.z);
    }
    // single tree + unlimited checks keeps the radius search exact
    cv::flann::Index tree(xyz, cv::flann::KDTreeIndexParams(1));
    const cv::flann::SearchParams params(cvflann::FLANN_CHECKS_UNLIMITED);
    const double radius2 = radius * radius; // flann L2 works on squared distances

    std::vector<MapPoint> kept; kept.reserve(mappoints_.size());
    std::vector<int> indices; std::vector<float> dists;
    for(int i=0;i<xyz.rows;++i){
        int found = tree.radiusSearch(xyz.row(i), indices, dists, radius2, minNeighbors, params);
        if(found >= minNeighbors) kept.push_back(mappoints_[i]);
    }
    int removed = static_cast<int>(mappoints_.size() - kept.size());
    mappoints_ = std::move(kept);
    rebuildIndex();
    return removed;
}

void MapManager::rebuildIndex(){
    mpid2idx_.clear();
    for(size_t i=0;i<mappoints_.size();++i) mpid2idx_[mappoints_[i].id] = static_cast<int>(i);
}

} // namespace ddloc
