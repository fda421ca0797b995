#include "Controller.hpp"

#include "Codebook.hpp"
#include "CodebookCache.hpp"
#include "DescriptorFuser.hpp"
#include "KeypointAssigner.hpp"
#include "MapManager.hpp"
#include "PoseEstimator.hpp"
#include <opencv2/core/quaternion.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ddloc {

namespace {

template <typename T>
void readKey(const cv::FileStorage &fs, const char *key, T &value){
    cv::FileNode n = fs[key];
    if(!n.empty()) n >> value;
}

void readFlag(const cv::FileStorage &fs, const char *key, bool &value){
    cv::FileNode n = fs[key];
    if(n.empty()) return;
    int v = 0; n >> v;
    value = v != 0;
}

struct DescriptorDims {
    int local = -1;
    int global = -1;
};

// First record with descriptors fixes the dimensions; every other record must agree.
void checkDims(const std::vector<ImageRecord> &records, bool fusing, DescriptorDims &dims){
    for(const auto &r: records){
        if(!r.desc.empty()){
            if(dims.local < 0) dims.local = r.desc.cols;
            else if(r.desc.cols != dims.local)
                throw std::invalid_argument("Controller: " + r.name + " has local descriptor dimension " +
                                            std::to_string(r.desc.cols) + ", expected " + std::to_string(dims.local));
        }
        if(fusing && !r.globalDesc.empty()){
            int dg = static_cast<int>(r.globalDesc.total());
            if(dims.global < 0) dims.global = dg;
            else if(dg != dims.global)
                throw std::invalid_argument("Controller: " + r.name + " has global descriptor dimension " +
                                            std::to_string(dg) + ", expected " + std::to_string(dims.global));
        }
    }
}

double elapsedSeconds(const std::chrono::steady_clock::time_point &t0){
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

ControllerOptions ControllerOptions::load(const std::string &path){
    cv::FileStorage fs;
    try{
        fs.open(path, cv::FileStorage::READ);
    } catch(const cv::Exception &e){
        throw std::runtime_error("ControllerOptions: cannot parse " + path + ": " + e.what());
    }
    if(!fs.isOpened()) throw std::runtime_error("ControllerOptions: cannot open " + path);

    ControllerOptions o;
    readKey(fs, "lambda", o.lambda);
    readFlag(fs, "use_global", o.use_global);
    readFlag(fs, "snap_query_global", o.snap_query_global);
    readFlag(fs, "remove_duplicates", o.remove_duplicates);
    readKey(fs, "max_pixel_distance", o.max_pixel_distance);
    readKey(fs, "precision_bits", o.precision_bits);
    readKey(fs, "reproj_threshold_px", o.reproj_threshold_px);
    readKey(fs, "ransac_iterations", o.ransac_iterations);
    readKey(fs, "ransac_confidence", o.ransac_confidence);
    readKey(fs, "min_inliers", o.min_inliers);
    readFlag(fs, "refine", o.refine);
    readKey(fs, "success_translation", o.success_translation);
    readKey(fs, "success_rotation_deg", o.success_rotation_deg);
    readKey(fs, "cache_dir", o.cache_dir);
    readFlag(fs, "use_cache", o.use_cache);
    readKey(fs, "output_path", o.output_path);
    readFlag(fs, "reduce_map", o.reduce_map);
    readKey(fs, "reduce_radius", o.reduce_radius);
    readKey(fs, "reduce_min_neighbors", o.reduce_min_neighbors);
    o.validate();
    return o;
}

void ControllerOptions::validate() const {
    if(!(lambda >= 0.0 && lambda <= 1.0)) throw std::invalid_argument("ControllerOptions: lambda must lie in [0,1]");
    if(precision_bits != 32 && precision_bits != 64) throw std::invalid_argument("ControllerOptions: precision_bits must be 32 or 64");
    if(!(max_pixel_distance > 0.0)) throw std::invalid_argument("ControllerOptions: max_pixel_distance must be positive");
    if(!(reproj_threshold_px > 0.0)) throw std::invalid_argument("ControllerOptions: reproj_threshold_px must be positive");
    if(ransac_iterations <= 0) throw std::invalid_argument("ControllerOptions: ransac_iterations must be positive");
    if(!(ransac_confidence > 0.0 && ransac_confidence < 1.0)) throw std::invalid_argument("ControllerOptions: ransac_confidence must lie in (0,1)");
    if(min_inliers < PoseEstimator::kMinimalSampleSize)
        throw std::invalid_argument("ControllerOptions: min_inliers must be at least " + std::to_string(PoseEstimator::kMinimalSampleSize));
    if(!(success_translation > 0.0) || !(success_rotation_deg > 0.0)) throw std::invalid_argument("ControllerOptions: success thresholds must be positive");
    if(reduce_map && (!(reduce_radius > 0.0) || reduce_min_neighbors < 1))
        throw std::invalid_argument("ControllerOptions: map reduction needs a positive radius and neighbour count");
}

std::string ControllerOptions::resultPath() const {
    if(!output_path.empty()) return output_path;
    return (std::filesystem::path(cache_dir) / "results.txt").string();
}

Controller::Controller() {
    // empty
}

std::string Controller::formatResult(const LocalizationResult &result){
    std::ostringstream ss;
    // image file name only, without its directory
    ss << std::filesystem::path(result.name).filename().string();
    if(!result.ok()){
        ss << " FAILED " << toString(result.status);
        return ss.str();
    }
    cv::Quatd q = cv::Quatd::createFromRotMat(result.R);
    // same rotation, canonical hemisphere
    if(q.w < 0) q = -q;
    // no "-0" in the output
    auto clean = [](double v){ return v == 0.0 ? 0.0 : v; };
    ss << std::setprecision(12)
       << " " << clean(q.w) << " " << clean(q.x) << " " << clean(q.y) << " " << clean(q.z)
       << " " << clean(result.t.at<double>(0)) << " " << clean(result.t.at<double>(1)) << " " << clean(result.t.at<double>(2));
    return ss.str();
}

int Controller::run(const std::string &manifestPath, const ControllerOptions &options){
    FileStorageDataLoader loader(manifestPath);
    return run(loader, options);
}

int Controller::run(const DataLoader &loader, const ControllerOptions &options){
    options.validate();
    results_.clear();
    perImageErrors_.clear();
    summary_ = EvaluationSummary();
    codebookFromCache_ = false;
    codebookSize_ = 0;

    auto t0 = std::chrono::steady_clock::now();
    const double lambda = options.effectiveLambda();
    const bool fusing = lambda < 1.0;

    MapManager map;
    map.addMapPoints(loader.mapPoints());
    std::vector<ImageRecord> train = loader.listTrainingRecords();
    std::vector<ImageRecord> queries = loader.listQueryRecords();
    std::cout << "Controller: dataset " << loader.datasetId() << " with " << map.size() << " points, "
              << train.size() << " training and " << queries.size() << " query images" << std::endl;

    // all configuration checks before any work
    DescriptorDims dims;
    checkDims(train, fusing, dims);
    checkDims(queries, fusing, dims);
    if(dims.local < 0) throw std::runtime_error("Controller: no image carries local descriptors");
    if(fusing && dims.global >= 0 && dims.global < dims.local)
        throw std::invalid_argument("Controller: global descriptor dimension " + std::to_string(dims.global) +
                                    " is smaller than local dimension " + std::to_string(dims.local));

    std::string mapId = loader.datasetId();
    if(options.reduce_map){
        int removed = map.cullIsolatedPoints(options.reduce_radius, options.reduce_min_neighbors);
        std::cout << "Controller: map reduction removed " << removed << " points, " << map.size() << " left" << std::endl;
        mapId += "-reduced";
    }

    DescriptorFuser fuser(lambda);
    KeypointAssigner assigner(options.max_pixel_distance);

    CodebookKey key;
    key.mapId = mapId;
    key.descriptorModelId = loader.descriptorModelId();
    key.lambda = lambda;
    key.useGlobal = fusing;
    key.precisionBits = options.precision_bits;
    key.maxPixelDistance = options.max_pixel_distance;
    if(options.reduce_map){
        key.reduceRadius = options.reduce_radius;
        key.reduceMinNeighbors = options.reduce_min_neighbors;
    }

    Codebook codebook;
    CodebookCache cache(options.cache_dir);
    if(options.use_cache && cache.load(key, dims.local, codebook)){
        codebookFromCache_ = true;
        std::cout << "Controller: loaded codebook from " << cache.pathFor(key) << std::endl;
    } else {
        if(options.use_cache) std::cout << "Controller: no cached codebook at " << cache.pathFor(key) << ", building" << std::endl;
        CodebookBuilder builder(map, assigner, fuser, options.precision_bits == 32 ? CV_32F : CV_64F);
        codebook = builder.build(train);
        std::cout << "Controller: codebook built from " << builder.numImages() << " images ("
                  << builder.numSkipped() << " skipped)" << std::endl;
        if(codebook.empty()) throw std::runtime_error("Controller: no training image contributed to the codebook");
        if(options.use_cache){
            std::string path = cache.save(key, codebook);
            std::cout << "Controller: codebook saved to " << path << std::endl;
        }
    }
    codebookSize_ = codebook.size();
    std::cout << "Controller: codebook has " << codebook.size() << " entries of dimension " << codebook.dim()
              << " (" << codebook.precisionBits() << "-bit)" << std::endl;

    PoseEstimatorOptions pnp;
    pnp.reproj_threshold_px = options.reproj_threshold_px;
    pnp.max_iterations = options.ransac_iterations;
    pnp.confidence = options.ransac_confidence;
    pnp.min_inliers = options.min_inliers;
    pnp.refine = options.refine;
    PoseEstimator poseEstimator(pnp);

    LocalizerOptions lopts;
    lopts.snap_query_global = options.snap_query_global;
    lopts.remove_duplicates = options.remove_duplicates;
    Localizer localizer(codebook, map, fuser, poseEstimator, lopts);

    if(fusing && options.snap_query_global){
        std::vector<cv::Mat> rows;
        for(const auto &r: train){
            if(r.globalDesc.empty()) continue;
            cv::Mat g;
            r.globalDesc.reshape(1, 1).convertTo(g, CV_64F);
            rows.push_back(g);
        }
        if(!rows.empty()){
            cv::Mat db;
            cv::vconcat(rows, db);
            localizer.setImageDescriptorDatabase(db);
            std::cout << "Controller: " << db.rows << " training global descriptors for query snapping" << std::endl;
        }
    }

    results_ = localizer.localizeAll(queries);

    std::string outPath = options.resultPath();
    std::filesystem::path outDir = std::filesystem::path(outPath).parent_path();
    if(!outDir.empty() && !std::filesystem::exists(outDir)) std::filesystem::create_directories(outDir);
    std::ofstream out(outPath);
    if(!out) throw std::runtime_error("Controller: cannot open " + outPath + " for writing");

    PoseEvaluator evaluator(options.success_translation, options.success_rotation_deg);
    int localized = 0;
    for(size_t i=0;i<results_.size();++i){
        const LocalizationResult &r = results_[i];
        out << formatResult(r) << "\n";
        if(r.ok()){
            ++localized;
        } else {
            std::cerr << "Controller: " << r.name << " not localized (" << toString(r.status) << "): " << r.reason << std::endl;
        }
        if(queries[i].hasPose()) evaluator.add(r, queries[i].R_cw, queries[i].t_cw);
    }
    out.close();
    std::cout << "Controller: localized " << localized << "/" << results_.size() << " queries, results in " << outPath << std::endl;

    summary_ = evaluator.summarize();
    perImageErrors_ = evaluator.perImageErrors();
    if(summary_.total > 0){
        std::cout << std::fixed << std::setprecision(4)
                  << "Controller: median translation error " << summary_.medianTranslation
                  << ", median rotation error " << summary_.medianRotationDeg << " deg" << std::endl;
        std::cout << std::setprecision(2)
                  << "Controller: " << 100.0 * summary_.successRate << "% within "
                  << options.success_translation << " / " << options.success_rotation_deg << " deg ("
                  << summary_.successes << "/" << summary_.total << ", "
                  << summary_.insufficient << " insufficient, " << summary_.failed << " failed)" << std::endl;
        std::cout.unsetf(std::ios::floatfield);
        std::cout << std::setprecision(6);
    }
    std::cout << "Controller: done in " << elapsedSeconds(t0) << " s" << std::endl;
    return 0;
}

} // namespace ddloc
