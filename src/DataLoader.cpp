#include "DataLoader.hpp"
#include <opencv2/core/quaternion.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace ddloc {

namespace {

void openManifest(const std::string &path, cv::FileStorage &fs){
    try{
        fs.open(path, cv::FileStorage::READ);
    } catch(const cv::Exception &e){
        throw std::runtime_error("DataLoader: cannot parse " + path + ": " + e.what());
    }
    if(!fs.isOpened()) throw std::runtime_error("DataLoader: cannot open " + path);
}

CameraModel readCamera(const cv::FileNode &node){
    if(node.empty()) return CameraModel();
    std::string model; int width = 0, height = 0; std::vector<double> params;
    node["model"] >> model;
    node["width"] >> width;
    node["height"] >> height;
    node["params"] >> params;
    return CameraModel::fromParams(model, width, height, params);
}

} // namespace

FileStorageDataLoader::FileStorageDataLoader(const std::string &manifestPath)
    : manifestPath_(manifestPath)
{
    baseDir_ = std::filesystem::path(manifestPath).parent_path().string();
    cv::FileStorage fs;
    openManifest(manifestPath_, fs);
    fs["dataset_id"] >> datasetId_;
    fs["descriptor_model"] >> descriptorModelId_;
    if(datasetId_.empty()) datasetId_ = std::filesystem::path(manifestPath).stem().string();
    if(fs["points"].empty()) throw std::runtime_error("DataLoader: " + manifestPath + " has no point table");
}

std::vector<MapPoint> FileStorageDataLoader::mapPoints() const {
    cv::FileStorage fs;
    openManifest(manifestPath_, fs);
    cv::Mat ids, xyz;
    fs["points"]["ids"] >> ids;
    fs["points"]["xyz"] >> xyz;
    if(ids.type() != CV_32S || xyz.cols != 3 || static_cast<int>(ids.total()) != xyz.rows)
        throw std::runtime_error("DataLoader: malformed point table in " + manifestPath_);
    xyz.convertTo(xyz, CV_64F);

    std::vector<MapPoint> pts; pts.reserve(xyz.rows);
    const int *id = ids.ptr<int>();
    for(int i=0;i<xyz.rows;++i){
        pts.emplace_back(id[i], cv::Point3d(xyz.at<double>(i,0), xyz.at<double>(i,1), xyz.at<double>(i,2)));
    }
    return pts;
}

bool FileStorageDataLoader::loadFeatures(const std::string &path, ImageRecord &record){
    if(!std::filesystem::exists(path)) return false;
    cv::Mat kps, desc, global;
    try{
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if(!fs.isOpened()) return false;
        fs["keypoints"] >> kps;
        fs["descriptors"] >> desc;
        fs["global_descriptor"] >> global;
    } catch(const cv::Exception &e){
        std::cerr << "DataLoader: unreadable feature file " << path << ": " << e.what() << std::endl;
        return false;
    }
    if(kps.empty() || desc.empty() || kps.cols != 2 || kps.rows != desc.rows) return false;

    kps.convertTo(kps, CV_32F);
    record.kps.resize(kps.rows);
    for(int i=0;i<kps.rows;++i) record.kps[i] = cv::Point2f(kps.at<float>(i,0), kps.at<float>(i,1));
    if(desc.depth() != CV_32F && desc.depth() != CV_64F) desc.convertTo(desc, CV_32F);
    record.desc = desc;
    if(!global.empty()){
        if(global.depth() != CV_32F && global.depth() != CV_64F) global.convertTo(global, CV_32F);
        record.globalDesc = global.reshape(1, 1);
    }
    return true;
}

std::vector<ImageRecord> FileStorageDataLoader::readRecords(const std::string &section) const {
    cv::FileStorage fs;
    openManifest(manifestPath_, fs);
    cv::FileNode list = fs[section];
    std::vector<ImageRecord> records;
    if(list.empty()) return records;
    if(!list.isSeq()) throw std::runtime_error("DataLoader: '" + section + "' must be a sequence in " + manifestPath_);

    for(auto it = list.begin(); it != list.end(); ++it){
        cv::FileNode node = *it;
        ImageRecord rec;
        node["name"] >> rec.name;
        rec.camera = readCamera(node["camera"]);

        std::vector<double> q, t;
        node["qvec"] >> q;
        node["tvec"] >> t;
        if(q.size() == 4 && t.size() == 3){
            cv::Matx33d R = cv::Quatd(q[0], q[1], q[2], q[3]).toRotMat3x3();
            rec.R_cw = cv::Mat(R, true);
            rec.t_cw = (cv::Mat_<double>(3,1) << t[0], t[1], t[2]);
        }

        std::vector<int> pids;
        node["point_ids"] >> pids;
        cv::Mat uvs;
        node["uvs"] >> uvs;
        bool hasUv = !uvs.empty() && uvs.rows == static_cast<int>(pids.size()) && uvs.cols == 2;
        if(hasUv) uvs.convertTo(uvs, CV_32F);
        rec.observations.reserve(pids.size());
        for(size_t i=0;i<pids.size();++i){
            PointObservation ob;
            ob.pointId = pids[i];
            ob.hasPixel = hasUv;
            if(hasUv) ob.pixel = cv::Point2f(uvs.at<float>(static_cast<int>(i),0), uvs.at<float>(static_cast<int>(i),1));
            rec.observations.push_back(ob);
        }

        std::string features;
        node["features"] >> features;
        if(!features.empty()){
            std::filesystem::path p(features);
            if(p.is_relative()) p = std::filesystem::path(baseDir_) / p;
            if(!loadFeatures(p.string(), rec))
                std::cerr << "DataLoader: no usable features for " << rec.name << " (" << p.string() << ")" << std::endl;
        }
        records.push_back(std::move(rec));
    }
    return records;
}

std::vector<ImageRecord> FileStorageDataLoader::listTrainingRecords() const { return readRecords("train"); }
std::vector<ImageRecord> FileStorageDataLoader::listQueryRecords() const { return readRecords("query"); }

} // namespace ddloc
