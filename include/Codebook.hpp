#pragma once
#include "ImageRecord.hpp"
#include "KeypointAssigner.hpp"
#include "DescriptorFuser.hpp"
#include "MapManager.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace ddloc {

// One mean descriptor per observed reconstruction point.
// Row i of descriptors() belongs to pointId(i); the id <-> row bijection is fixed at construction.
class Codebook {
public:
    Codebook() = default;
    // descriptors: N x D (CV_32F or CV_64F), one row per entry of pointIds/counts.
    // Throws std::invalid_argument on size mismatch, duplicate ids or a zero count.
    Codebook(std::vector<PointId> pointIds, cv::Mat descriptors, std::vector<int> counts);

    int size() const { return static_cast<int>(pointIds_.size()); }
    int dim() const { return descriptors_.cols; }
    bool empty() const { return pointIds_.empty(); }
    // 32 or 64
    int precisionBits() const { return descriptors_.depth() == CV_32F ? 32 : 64; }

    const cv::Mat& descriptors() const { return descriptors_; }
    const std::vector<PointId>& pointIds() const { return pointIds_; }
    const std::vector<int>& counts() const { return counts_; }

    PointId pointId(int index) const { return pointIds_.at(index); }
    int observationCount(int index) const { return counts_.at(index); }
    cv::Mat mean(int index) const { return descriptors_.row(index); }
    // -1 if the point never received an entry
    int indexOf(PointId id) const;

private:
    std::vector<PointId> pointIds_;
    cv::Mat descriptors_;
    std::vector<int> counts_;
    std::unordered_map<PointId,int> pid2idx_;
};

// Fused descriptors of one training image, ready to be accumulated.
struct ImageContribution {
    std::vector<PointId> pointIds; // one per row of descriptors
    cv::Mat descriptors;           // fused, N x Dl
    bool skipped = false;
    std::string reason;            // why the image was skipped
};

// Accumulates running sums (double precision) and counts per point over the training set,
// then emits the Codebook as sum / count in the requested precision.
class CodebookBuilder {
public:
    // precision: CV_32F or CV_64F for the emitted descriptors.
    CodebookBuilder(const MapManager &map, const KeypointAssigner &assigner,
                    const DescriptorFuser &fuser, int precision = CV_64F);

    // Pure per-image step: resolve observations, assign keypoints, fuse. Safe to run concurrently.
    ImageContribution contribute(const ImageRecord &record) const;
    // Serial reduce step. First occurrence of a point id allocates the next dense index.
    void accumulate(const ImageContribution &contribution);
    // contribute + accumulate; returns false when the image was skipped.
    bool addImage(const ImageRecord &record);

    // Parallel map over the records, serial reduce in record order, then finalize().
    Codebook build(const std::vector<ImageRecord> &records);

    Codebook finalize() const;

    int numPoints() const { return static_cast<int>(pointIds_.size()); }
    int numImages() const { return numImages_; }
    int numSkipped() const { return numSkipped_; }
    void reset();

private:
    const MapManager &map_;
    const KeypointAssigner &assigner_;
    const DescriptorFuser &fuser_;
    int precision_;

    cv::Mat sums_; // CV_64F, one row per dense index
    std::vector<int> counts_;
    std::vector<PointId> pointIds_; // dense index -> id, in first-seen order
    std::unordered_map<PointId,int> pid2idx_;
    int numImages_ = 0;
    int numSkipped_ = 0;
};

} // namespace ddloc
