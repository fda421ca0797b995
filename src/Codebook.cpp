#include "Codebook.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace ddloc {

Codebook::Codebook(std::vector<PointId> pointIds, cv::Mat descriptors, std::vector<int> counts)
    : pointIds_(std::move(pointIds)), descriptors_(std::move(descriptors)), counts_(std::move(counts))
{
    if(descriptors_.rows != static_cast<int>(pointIds_.size()) || counts_.size() != pointIds_.size())
        throw std::invalid_argument("Codebook: point ids, descriptors and counts differ in length");
    if(!descriptors_.empty() && descriptors_.depth() != CV_32F && descriptors_.depth() != CV_64F)
        throw std::invalid_argument("Codebook: descriptors must be CV_32F or CV_64F");
    pid2idx_.reserve(pointIds_.size());
    for(size_t i=0;i<pointIds_.size();++i){
        if(counts_[i] < 1) throw std::invalid_argument("Codebook: entry with zero observations for point " + std::to_string(pointIds_[i]));
        if(!pid2idx_.emplace(pointIds_[i], static_cast<int>(i)).second)
            throw std::invalid_argument("Codebook: duplicate point id " + std::to_string(pointIds_[i]));
    }
}

int Codebook::indexOf(PointId id) const {
    auto it = pid2idx_.find(id);
    return it == pid2idx_.end() ? -1 : it->second;
}

CodebookBuilder::CodebookBuilder(const MapManager &map, const KeypointAssigner &assigner,
                                 const DescriptorFuser &fuser, int precision)
    : map_(map), assigner_(assigner), fuser_(fuser), precision_(precision)
{
    if(precision_ != CV_32F && precision_ != CV_64F) throw std::invalid_argument("CodebookBuilder: precision must be CV_32F or CV_64F");
}

void CodebookBuilder::reset(){
    sums_.release(); counts_.clear(); pointIds_.clear(); pid2idx_.clear();
    numImages_ = 0; numSkipped_ = 0;
}

ImageContribution CodebookBuilder::contribute(const ImageRecord &record) const {
    ImageContribution out;
    if(!record.hasLocalFeatures()){
        out.skipped = true; out.reason = "missing local descriptors";
        return out;
    }
    if(fuser_.enabled() && record.globalDesc.empty()){
        out.skipped = true; out.reason = "missing global descriptor";
        return out;
    }

    std::vector<PointObservation> obs = KeypointAssigner::resolveObservations(record, map_);
    std::vector<Correspondence> corr = assigner_.assign(obs, record.kps);
    if(corr.empty()) return out;

    cv::Mat selected(static_cast<int>(corr.size()), record.desc.cols, record.desc.type());
    out.pointIds.reserve(corr.size());
    for(size_t i=0;i<corr.size();++i){
        record.desc.row(corr[i].keypointIndex).copyTo(selected.row(static_cast<int>(i)));
        out.pointIds.push_back(corr[i].pointId);
    }
    out.descriptors = fuser_.fuse(selected, record.globalDesc);
    return out;
}

void CodebookBuilder::accumulate(const ImageContribution &contribution){
    ++numImages_;
    if(contribution.skipped){ ++numSkipped_; return; }
    if(contribution.pointIds.empty()) return;
    if(!sums_.empty() && contribution.descriptors.cols != sums_.cols)
        throw std::invalid_argument("CodebookBuilder: descriptor dimension changed from " + std::to_string(sums_.cols) +
                                    " to " + std::to_string(contribution.descriptors.cols));

    cv::Mat fused64; contribution.descriptors.convertTo(fused64, CV_64F);
    for(size_t i=0;i<contribution.pointIds.size();++i){
        PointId pid = contribution.pointIds[i];
        auto it = pid2idx_.find(pid);
        int idx;
        if(it == pid2idx_.end()){
            idx = static_cast<int>(pointIds_.size());
            pid2idx_.emplace(pid, idx);
            pointIds_.push_back(pid);
            counts_.push_back(0);
            sums_.push_back(cv::Mat::zeros(1, fused64.cols, CV_64F));
        } else {
            idx = it->second;
        }
        cv::Mat row = sums_.row(idx);
        row += fused64.row(static_cast<int>(i));
        counts_[idx] += 1;
    }
}

bool CodebookBuilder::addImage(const ImageRecord &record){
    ImageContribution c = contribute(record);
    if(c.skipped) std::cerr << "CodebookBuilder: skipping " << record.name << " (" << c.reason << ")" << std::endl;
    accumulate(c);
    return !c.skipped;
}

Codebook CodebookBuilder::build(const std::vector<ImageRecord> &records){
    std::vector<ImageContribution> contributions(records.size());
    std::vector<std::string> errors(records.size());
    cv::parallel_for_(cv::Range(0, static_cast<int>(records.size())), [&](const cv::Range &range){
        for(int i=range.start;i<range.end;++i){
            try{
                contributions[i] = contribute(records[i]);
            } catch(const std::exception &e){
                errors[i] = e.what();
            }
        }
    });
    for(size_t i=0;i<errors.size();++i){
        if(!errors[i].empty()) throw std::invalid_argument("CodebookBuilder: " + records[i].name + ": " + errors[i]);
    }

    for(size_t i=0;i<records.size();++i){
        if(contributions[i].skipped)
            std::cerr << "CodebookBuilder: skipping " << records[i].name << " (" << contributions[i].reason << ")" << std::endl;
        accumulate(contributions[i]);
        contributions[i] = ImageContribution(); // release fused rows early
    }
    return finalize();
}

Codebook CodebookBuilder::finalize() const {
    if(pointIds_.empty()) return Codebook();

    cv::Mat means(sums_.rows, sums_.cols, CV_64F);
    int nonFinite = 0;
    for(int i=0;i<sums_.rows;++i){
        cv::Mat row = means.row(i);
        row = sums_.row(i) / static_cast<double>(counts_[i]);
        if(!cv::checkRange(row)) ++nonFinite;
    }
    if(nonFinite > 0)
        std::cerr << "CodebookBuilder: warning: " << nonFinite << " codebook entries contain non-finite values" << std::endl;

    cv::Mat stored;
    if(precision_ == CV_64F) stored = means;
    else means.convertTo(stored, precision_);
    return Codebook(pointIds_, stored, counts_);
}

} // namespace ddloc
