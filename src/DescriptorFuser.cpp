#include "DescriptorFuser.hpp"
#include <stdexcept>
#include <string>

namespace ddloc {

namespace {

template<typename T>
void blendRows(const cv::Mat &local, const cv::Mat &global64, double lambda, cv::Mat &out){
    const double mu = 1.0 - lambda;
    const double *g = global64.ptr<double>(0);
    for(int r=0;r<local.rows;++r){
        const T *l = local.ptr<T>(r);
        T *o = out.ptr<T>(r);
        for(int c=0;c<local.cols;++c) o[c] = static_cast<T>(lambda * l[c] + mu * g[c]);
    }
}

} // namespace

DescriptorFuser::DescriptorFuser(double lambda)
    : lambda_(lambda)
{
    if(!(lambda_ >= 0.0 && lambda_ <= 1.0)) throw std::invalid_argument("DescriptorFuser: lambda must lie in [0,1], got " + std::to_string(lambda));
}

cv::Mat DescriptorFuser::fuse(const cv::Mat &local, const cv::Mat &global) const {
    if(local.empty()) return cv::Mat();
    if(local.channels() != 1 || (local.depth() != CV_32F && local.depth() != CV_64F))
        throw std::invalid_argument("DescriptorFuser: local descriptors must be single-channel float");
    if(lambda_ == 1.0) return local.clone();

    if(global.empty()) throw std::invalid_argument("DescriptorFuser: global descriptor required when lambda < 1");
    cv::Mat g = (global.isContinuous() ? global : global.clone()).reshape(1, 1);
    if(g.cols < local.cols)
        throw std::invalid_argument("DescriptorFuser: global dimension " + std::to_string(g.cols) +
                                    " is smaller than local dimension " + std::to_string(local.cols));
    cv::Mat g64; g.colRange(0, local.cols).convertTo(g64, CV_64F);

    cv::Mat out(local.size(), local.type());
    if(lambda_ == 0.0){
        cv::Mat gRow; g64.convertTo(gRow, local.type());
        for(int r=0;r<out.rows;++r) gRow.copyTo(out.row(r));
        return out;
    }
    if(local.depth() == CV_32F) blendRows<float>(local, g64, lambda_, out);
    else blendRows<double>(local, g64, lambda_, out);
    return out;
}

} // namespace ddloc
