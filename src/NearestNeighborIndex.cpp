#include "NearestNeighborIndex.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace ddloc {

namespace {

// a ranks before b
inline bool rankBefore(const Neighbor &a, const Neighbor &b){
    return a.distance < b.distance || (a.distance == b.distance && a.index < b.index);
}

// NaN distances (non-finite codebook rows) rank after every finite candidate
inline double rankDistance(const cv::Mat &q, const cv::Mat &row){
    double d = cv::norm(q, row, cv::NORM_L2SQR);
    return std::isnan(d) ? std::numeric_limits<double>::infinity() : d;
}

} // namespace

void NearestNeighborIndex::build(const cv::Mat &vectors){
    if(vectors.empty()) throw std::invalid_argument("NearestNeighborIndex: cannot build over an empty set");
    if(vectors.channels() != 1 || (vectors.depth() != CV_32F && vectors.depth() != CV_64F))
        throw std::invalid_argument("NearestNeighborIndex: vectors must be single-channel float");
    data_ = vectors.clone();
}

cv::Mat NearestNeighborIndex::prepareQueries(const cv::Mat &queries) const {
    if(data_.empty()) throw std::logic_error("NearestNeighborIndex: query before build");
    if(queries.cols != data_.cols)
        throw std::invalid_argument("NearestNeighborIndex: query dimension " + std::to_string(queries.cols) +
                                    " does not match index dimension " + std::to_string(data_.cols));
    if(queries.type() == data_.type()) return queries;
    cv::Mat converted; queries.convertTo(converted, data_.type());
    return converted;
}

void NearestNeighborIndex::searchRow(const cv::Mat &q, int k, std::vector<Neighbor> &out) const {
    out.clear();
    const int n = data_.rows;
    k = std::min(k, n);
    if(k <= 0) return;

    if(k == 1){
        Neighbor best; best.distance = rankDistance(q, data_.row(0)); best.index = 0;
        for(int i=1;i<n;++i){
            double d = rankDistance(q, data_.row(i));
            if(d < best.distance){ best.distance = d; best.index = i; }
        }
        out.push_back(best);
        return;
    }

    // max-heap of the k best so far, worst on top
    out.reserve(k);
    for(int i=0;i<n;++i){
        Neighbor cand; cand.distance = rankDistance(q, data_.row(i)); cand.index = i;
        if(static_cast<int>(out.size()) < k){
            out.push_back(cand);
            std::push_heap(out.begin(), out.end(), rankBefore);
        } else if(rankBefore(cand, out.front())){
            std::pop_heap(out.begin(), out.end(), rankBefore);
            out.back() = cand;
            std::push_heap(out.begin(), out.end(), rankBefore);
        }
    }
    std::sort_heap(out.begin(), out.end(), rankBefore);
}

std::vector<Neighbor> NearestNeighborIndex::query(const cv::Mat &q, int k) const {
    cv::Mat qq = prepareQueries(q.rows == 1 ? q : q.reshape(1, 1));
    std::vector<Neighbor> out;
    searchRow(qq, k, out);
    return out;
}

std::vector<std::vector<Neighbor>> NearestNeighborIndex::batchQuery(const cv::Mat &queries, int k) const {
    std::vector<std::vector<Neighbor>> out(queries.rows);
    if(queries.empty()) return out;
    cv::Mat qq = prepareQueries(queries);
    cv::parallel_for_(cv::Range(0, qq.rows), [&](const cv::Range &range){
        for(int r=range.start;r<range.end;++r) searchRow(qq.row(r), k, out[r]);
    });
    return out;
}

} // namespace ddloc
