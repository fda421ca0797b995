#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace ddloc {

struct Neighbor {
    double distance = 0.0; // squared Euclidean
    int index = -1;        // row in the indexed matrix
};

// Exact (brute force) k-nearest-neighbour search over the rows of a float matrix.
// Results are ordered by ascending distance, ties by ascending index.
// After build() the index is read-only; concurrent queries are safe.
class NearestNeighborIndex {
public:
    NearestNeighborIndex() = default;

    // vectors: N x D, CV_32F or CV_64F. The rows are copied.
    void build(const cv::Mat &vectors);

    // q: 1 x D row. Converted to the index precision before the search.
    std::vector<Neighbor> query(const cv::Mat &q, int k) const;
    // One result list per row of queries, computed in parallel.
    std::vector<std::vector<Neighbor>> batchQuery(const cv::Mat &queries, int k) const;

    int size() const { return data_.rows; }
    int dim() const { return data_.cols; }
    int type() const { return data_.type(); }
    bool empty() const { return data_.empty(); }
    const cv::Mat& vectors() const { return data_; }

private:
    void searchRow(const cv::Mat &q, int k, std::vector<Neighbor> &out) const;
    cv::Mat prepareQueries(const cv::Mat &queries) const;

    cv::Mat data_;
};

} // namespace ddloc
