#pragma once
#include "Localizer.hpp"
#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace ddloc {

struct PoseError {
    double translation = 0.0; // map units
    double rotationDeg = 0.0;
};

struct EvaluationSummary {
    int total = 0;
    int localized = 0;
    int insufficient = 0;
    int failed = 0;
    int successes = 0;              // frames within both thresholds
    double medianTranslation = 0.0; // over all frames; unlocalized frames count as +inf
    double medianRotationDeg = 0.0;
    double successRate = 0.0;       // successes / total, in [0,1]
};

// Accumulates pose errors of a test set and reports median errors and the joint success rate.
class PoseEvaluator {
public:
    explicit PoseEvaluator(double translationThreshold = 0.05, double rotationThresholdDeg = 5.0);

    // Translation error: ||t_est - t_gt||. Rotation error: angle of the rotation vector of
    // R_est * R_gt^T, in degrees.
    static PoseError compare(const cv::Mat &R_est, const cv::Mat &t_est,
                             const cv::Mat &R_gt, const cv::Mat &t_gt);

    // Records one frame; a non-successful result counts with infinite errors.
    void add(const LocalizationResult &result, const cv::Mat &R_gt, const cv::Mat &t_gt);
    EvaluationSummary summarize() const;

    // Ascending sort, element at floor(n/2). NaN for an empty list.
    static double median(std::vector<double> values);

    const std::map<std::string, PoseError>& perImageErrors() const { return name2err_; }
    void clear();

private:
    double transThresh_, rotThreshDeg_;
    std::vector<double> tErrs_, rErrs_;
    std::map<std::string, PoseError> name2err_;
    int insufficient_ = 0, failed_ = 0, successes_ = 0;
};

} // namespace ddloc
