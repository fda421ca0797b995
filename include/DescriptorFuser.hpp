#pragma once
#include <opencv2/core.hpp>

namespace ddloc {

// Linear blend of local keypoint descriptors with a whole-image descriptor:
//   fused = lambda * local + (1 - lambda) * global[0:Dl]
// lambda == 1 disables fusion (local descriptors are returned untouched).
class DescriptorFuser {
public:
    explicit DescriptorFuser(double lambda = 0.5);

    // local: N x Dl (CV_32F or CV_64F), global: 1 x Dg with Dg >= Dl.
    // Result has the type and shape of local.
    cv::Mat fuse(const cv::Mat &local, const cv::Mat &global) const;

    double lambda() const { return lambda_; }
    bool enabled() const { return lambda_ < 1.0; }
private:
    double lambda_;
};

} // namespace ddloc
