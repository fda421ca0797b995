#pragma once
#include "Codebook.hpp"
#include "DescriptorFuser.hpp"
#include "ImageRecord.hpp"
#include "MapManager.hpp"
#include "NearestNeighborIndex.hpp"
#include "PoseEstimator.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ddloc {

struct LocalizerOptions {
    bool snap_query_global = true;   // replace the query global descriptor by its nearest training one
    bool remove_duplicates = false;  // keep only the closest keypoint per retrieved point
};

enum class LocalizationStatus { Success, InsufficientCorrespondences, LocalizationFailed };

const char* toString(LocalizationStatus status);

struct LocalizationResult {
    std::string name;
    LocalizationStatus status = LocalizationStatus::LocalizationFailed;
    std::string reason;               // set when status != Success
    cv::Mat R, t;                     // world-to-camera, CV_64F
    std::vector<uchar> inlierMask;    // one entry per correspondence
    int numCorrespondences = 0;
    int numInliers = 0;
    double meanReprojError = 0.0;     // over inliers, pixels

    bool ok() const { return status == LocalizationStatus::Success; }
};

// 2D-3D correspondences produced by matching fused query descriptors to the codebook.
struct MapMatches {
    std::vector<cv::Point2f> pixels;
    std::vector<cv::Point3d> world;
    std::vector<PointId> pointIds;
    std::vector<double> distances; // squared descriptor distances
};

// Localizes query images against a codebook. Holds read-only indices, so localize() may be
// called concurrently once construction and setImageDescriptorDatabase() are done.
class Localizer {
public:
    // Builds the point index over codebook.descriptors(). codebook and map must outlive the Localizer.
    Localizer(const Codebook &codebook, const MapManager &map, const DescriptorFuser &fuser,
              const PoseEstimator &poseEstimator, const LocalizerOptions &options = LocalizerOptions());

    // Training-image global descriptors (one row per image) used to snap query global descriptors.
    void setImageDescriptorDatabase(const cv::Mat &trainGlobalDescs);
    bool hasImageDescriptorDatabase() const { return !imageIndex_.empty(); }

    // Descriptors used for retrieval: the query global descriptor is optionally snapped, then fused.
    cv::Mat prepareDescriptors(const ImageRecord &query) const;
    // Nearest codebook entry per descriptor row, mapped to 3D.
    MapMatches matchToMap(const cv::Mat &descriptors, const std::vector<cv::Point2f> &kps) const;
    // Full pipeline for one query. Never throws for per-image conditions.
    LocalizationResult localize(const ImageRecord &query) const;
    // One result per query, same order, computed in parallel.
    std::vector<LocalizationResult> localizeAll(const std::vector<ImageRecord> &queries) const;

    const NearestNeighborIndex& pointIndex() const { return pointIndex_; }
    const LocalizerOptions& options() const { return options_; }

private:
    const Codebook &codebook_;
    const MapManager &map_;
    DescriptorFuser fuser_;
    PoseEstimator poseEstimator_;
    LocalizerOptions options_;

    NearestNeighborIndex pointIndex_;
    NearestNeighborIndex imageIndex_;
    std::vector<cv::Point3d> codebookXyz_; // codebook index -> 3D position
};

} // namespace ddloc
