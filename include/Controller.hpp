#pragma once
#include "DataLoader.hpp"
#include "Localizer.hpp"
#include "PoseEvaluator.hpp"
#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace ddloc {

// ControllerOptions holds the tunables of a localization run
struct ControllerOptions {
    double lambda = 0.5;              // weight of the local descriptor in the fused descriptor
    bool use_global = true;           // false: plain local descriptors (lambda treated as 1)
    bool snap_query_global = true;    // replace query global descriptors by the nearest training one
    bool remove_duplicates = false;   // one keypoint per retrieved map point
    double max_pixel_distance = 5.0;  // observation -> keypoint assignment radius (px)
    int precision_bits = 64;          // codebook storage, 32 or 64

    double reproj_threshold_px = 12.0;
    int ransac_iterations = 10000;
    double ransac_confidence = 0.9999;
    int min_inliers = 4;
    bool refine = true;

    double success_translation = 0.05; // map units
    double success_rotation_deg = 5.0;

    std::string cache_dir = "output";
    bool use_cache = true;
    std::string output_path;          // empty: <cache_dir>/results.txt

    bool reduce_map = false;          // drop isolated points before building the codebook
    double reduce_radius = 5.0;
    int reduce_min_neighbors = 16;

    // Reads the keys above from a cv::FileStorage file; missing keys keep their defaults.
    // Throws std::runtime_error if the file cannot be read, std::invalid_argument on bad values.
    static ControllerOptions load(const std::string &path);
    void validate() const;

    double effectiveLambda() const { return use_global ? lambda : 1.0; }
    std::string resultPath() const;
};

class Controller {
public:
    Controller();

    // Full batch: validate, (reduce map), load or build the codebook, localize all queries,
    // write the result file and evaluate queries that carry a ground-truth pose.
    // Returns 0 on completion; configuration errors throw.
    int run(const DataLoader &loader, const ControllerOptions &options = ControllerOptions());
    // Same, with a FileStorageDataLoader over the given manifest.
    int run(const std::string &manifestPath, const ControllerOptions &options = ControllerOptions());

    // "name qw qx qy qz tx ty tz" or "name FAILED <status>"
    static std::string formatResult(const LocalizationResult &result);

    const std::vector<LocalizationResult>& results() const { return results_; }
    const EvaluationSummary& summary() const { return summary_; }
    const std::map<std::string, PoseError>& perImageErrors() const { return perImageErrors_; }
    bool codebookFromCache() const { return codebookFromCache_; }
    int codebookSize() const { return codebookSize_; }

private:
    std::vector<LocalizationResult> results_;
    EvaluationSummary summary_;
    std::map<std::string, PoseError> perImageErrors_;
    bool codebookFromCache_ = false;
    int codebookSize_ = 0;
};

} // namespace ddloc
