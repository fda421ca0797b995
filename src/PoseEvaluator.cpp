#include "PoseEvaluator.hpp"
#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace ddloc {

PoseEvaluator::PoseEvaluator(double translationThreshold, double rotationThresholdDeg)
    : transThresh_(translationThreshold), rotThreshDeg_(rotationThresholdDeg)
{
    if(!(transThresh_ > 0.0) || !(rotThreshDeg_ > 0.0)) throw std::invalid_argument("PoseEvaluator: thresholds must be positive");
}

PoseError PoseEvaluator::compare(const cv::Mat &R_est, const cv::Mat &t_est,
                                 const cv::Mat &R_gt, const cv::Mat &t_gt){
    cv::Mat Re, Rg, te, tg;
    R_est.convertTo(Re, CV_64F); R_gt.convertTo(Rg, CV_64F);
    t_est.convertTo(te, CV_64F); t_gt.convertTo(tg, CV_64F);
    if(Re.size() != cv::Size(3,3) || Rg.size() != cv::Size(3,3) || te.total() != 3 || tg.total() != 3)
        throw std::invalid_argument("PoseEvaluator: expected 3x3 rotations and 3-vector translations");

    PoseError err;
    err.translation = cv::norm(te.reshape(1,3), tg.reshape(1,3), cv::NORM_L2);
    cv::Mat rvec;
    cv::Mat Rdiff = Re * Rg.t();
    cv::Rodrigues(Rdiff, rvec);
    err.rotationDeg = cv::norm(rvec) * 180.0 / CV_PI;
    return err;
}

void PoseEvaluator::add(const LocalizationResult &result, const cv::Mat &R_gt, const cv::Mat &t_gt){
    PoseError err;
    if(result.ok()){
        err = compare(result.R, result.t, R_gt, t_gt);
        if(err.translation < transThresh_ && err.rotationDeg < rotThreshDeg_) ++successes_;
    } else {
        err.translation = std::numeric_limits<double>::infinity();
        err.rotationDeg = std::numeric_limits<double>::infinity();
        if(result.status == LocalizationStatus::InsufficientCorrespondences) ++insufficient_;
        else ++failed_;
    }
    tErrs_.push_back(err.translation);
    rErrs_.push_back(err.rotationDeg);
    name2err_[result.name] = err;
}

double PoseEvaluator::median(std::vector<double> values){
    if(values.empty()) return std::numeric_limits<double>::quiet_NaN();
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

EvaluationSummary PoseEvaluator::summarize() const {
    EvaluationSummary s;
    s.total = static_cast<int>(tErrs_.size());
    s.insufficient = insufficient_;
    s.failed = failed_;
    s.localized = s.total - insufficient_ - failed_;
    s.successes = successes_;
    s.medianTranslation = median(tErrs_);
    s.medianRotationDeg = median(rErrs_);
    s.successRate = s.total > 0 ? static_cast<double>(successes_) / s.total : 0.0;
    return s;
}

void PoseEvaluator::clear(){
    tErrs_.clear(); rErrs_.clear(); name2err_.clear();
    insufficient_ = failed_ = successes_ = 0;
}

} // namespace ddloc
