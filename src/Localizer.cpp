#include "Localizer.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace ddloc {

const char* toString(LocalizationStatus status){
    switch(status){
    case LocalizationStatus::Success: return "success";
    case LocalizationStatus::InsufficientCorrespondences: return "insufficient_correspondences";
    case LocalizationStatus::LocalizationFailed: return "localization_failed";
    }
    return "unknown";
}

Localizer::Localizer(const Codebook &codebook, const MapManager &map, const DescriptorFuser &fuser,
                     const PoseEstimator &poseEstimator, const LocalizerOptions &options)
    : codebook_(codebook), map_(map), fuser_(fuser), poseEstimator_(poseEstimator), options_(options)
{
    if(codebook_.empty()) throw std::invalid_argument("Localizer: empty codebook");
    pointIndex_.build(codebook_.descriptors());
    codebookXyz_.reserve(codebook_.size());
    for(PointId pid: codebook_.pointIds()){
        int idx = map_.mapPointIndex(pid);
        if(idx < 0) throw std::invalid_argument("Localizer: codebook point " + std::to_string(pid) + " is not in the map");
        codebookXyz_.push_back(map_.mappoints()[idx].p);
    }
}

void Localizer::setImageDescriptorDatabase(const cv::Mat &trainGlobalDescs){
    imageIndex_.build(trainGlobalDescs);
}

cv::Mat Localizer::prepareDescriptors(const ImageRecord &query) const {
    if(!fuser_.enabled()) return query.desc;
    if(query.globalDesc.empty()) throw std::invalid_argument("Localizer: " + query.name + " has no global descriptor");

    cv::Mat global = query.globalDesc;
    if(options_.snap_query_global && hasImageDescriptorDatabase()){
        std::vector<Neighbor> nn = imageIndex_.query(global, 1);
        global = imageIndex_.vectors().row(nn.front().index);
    }
    return fuser_.fuse(query.desc, global);
}

MapMatches Localizer::matchToMap(const cv::Mat &descriptors, const std::vector<cv::Point2f> &kps) const {
    MapMatches out;
    if(descriptors.empty()) return out;
    if(descriptors.rows != static_cast<int>(kps.size())) throw std::invalid_argument("Localizer: keypoint and descriptor counts differ");

    std::vector<std::vector<Neighbor>> nn = pointIndex_.batchQuery(descriptors, 1);
    out.pixels.reserve(nn.size()); out.world.reserve(nn.size());
    out.pointIds.reserve(nn.size()); out.distances.reserve(nn.size());

    // codebook index -> slot in out (dedup only)
    std::unordered_map<int,size_t> slotOf;
    for(size_t q=0;q<nn.size();++q){
        if(nn[q].empty()) continue;
        const Neighbor &m = nn[q].front();
        if(options_.remove_duplicates){
            auto it = slotOf.find(m.index);
            if(it != slotOf.end()){
                size_t s = it->second;
                if(m.distance < out.distances[s]){ out.distances[s] = m.distance; out.pixels[s] = kps[q]; }
                continue;
            }
            slotOf.emplace(m.index, out.pixels.size());
        }
        out.pixels.push_back(kps[q]);
        out.world.push_back(codebookXyz_[m.index]);
        out.pointIds.push_back(codebook_.pointId(m.index));
        out.distances.push_back(m.distance);
    }
    return out;
}

LocalizationResult Localizer::localize(const ImageRecord &query) const {
    LocalizationResult res;
    res.name = query.name;
    if(!query.hasLocalFeatures()){
        res.reason = "missing local descriptors";
        return res;
    }
    if(fuser_.enabled() && query.globalDesc.empty()){
        res.reason = "missing global descriptor";
        return res;
    }
    if(!query.camera.valid()){
        res.reason = "missing camera calibration";
        return res;
    }

    MapMatches matches = matchToMap(prepareDescriptors(query), query.kps);
    res.numCorrespondences = static_cast<int>(matches.pixels.size());

    std::string why;
    PoseStatus st = poseEstimator_.estimate(matches.pixels, matches.world, query.camera,
                                            res.R, res.t, res.inlierMask, res.numInliers, &why);
    switch(st){
    case PoseStatus::Success:
        res.status = LocalizationStatus::Success;
        res.meanReprojError = PoseEstimator::meanReprojectionError(matches.pixels, matches.world, query.camera,
                                                                   res.R, res.t, res.inlierMask);
        break;
    case PoseStatus::InsufficientCorrespondences:
        res.status = LocalizationStatus::InsufficientCorrespondences;
        res.reason = why;
        break;
    case PoseStatus::Failed:
        res.status = LocalizationStatus::LocalizationFailed;
        res.reason = why;
        break;
    }
    return res;
}

std::vector<LocalizationResult> Localizer::localizeAll(const std::vector<ImageRecord> &queries) const {
    std::vector<LocalizationResult> out(queries.size());
    std::vector<std::string> errors(queries.size());
    cv::parallel_for_(cv::Range(0, static_cast<int>(queries.size())), [&](const cv::Range &range){
        for(int i=range.start;i<range.end;++i){
            try{
                out[i] = localize(queries[i]);
            } catch(const std::exception &e){
                errors[i] = e.what();
            }
        }
    });
    // anything thrown here is a setup mismatch, not a per-image condition
    for(size_t i=0;i<errors.size();++i){
        if(!errors[i].empty()) throw std::invalid_argument("Localizer: " + queries[i].name + ": " + errors[i]);
    }
    return out;
}

} // namespace ddloc
