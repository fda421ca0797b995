#include "Controller.hpp"
#include "TestCommon.hpp"
#include <opencv2/core/quaternion.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace ddloc;
using testutil::check;
namespace fs = std::filesystem;

// DataLoader over records held in memory.
class MemoryLoader : public DataLoader {
public:
    std::string id = "memory";
    std::vector<MapPoint> points;
    std::vector<ImageRecord> train, query;

    std::string datasetId() const override { return id; }
    std::string descriptorModelId() const override { return "synthetic"; }
    std::vector<MapPoint> mapPoints() const override { return points; }
    std::vector<ImageRecord> listTrainingRecords() const override { return train; }
    std::vector<ImageRecord> listQueryRecords() const override { return query; }
};

static std::vector<std::string> readLines(const std::string &path){
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while(std::getline(in, line)) lines.push_back(line);
    return lines;
}

static MemoryLoader makeLoader(const testutil::SyntheticScene &scene){
    MemoryLoader loader;
    loader.points = scene.points;
    cv::RNG rng(99);
    testutil::ImageOptions opt; opt.pixelNoise = 0.5; opt.descNoise = 0.02; opt.globalNoise = 0.01;
    for(int k=0;k<4;++k){
        loader.train.push_back(testutil::makeImage(scene, "db/" + std::to_string(k),
                                                   testutil::rotation(0.02*k, 0.03*k, 0.0),
                                                   testutil::translation(0.25*k - 0.4, 0.0, 0.1*k), rng, opt));
    }
    testutil::ImageOptions qopt; qopt.pixelNoise = 0.3; qopt.descNoise = 0.02; qopt.globalNoise = 0.01;
    qopt.distractors = 5; qopt.observations = false;
    ImageRecord good = testutil::makeImage(scene, "query/good", testutil::rotation(0.01, 0.05, 0.0),
                                           testutil::translation(0.05, 0.0, 0.2), rng, qopt);
    ImageRecord two = good;
    two.name = "query/two";
    two.kps.resize(2);
    two.desc = good.desc.rowRange(0, 2).clone();
    ImageRecord blind = good;
    blind.name = "query/blind";
    blind.desc = cv::Mat();
    loader.query = {good, two, blind};
    return loader;
}

int main() {
    std::cout << "=== Testing Controller ===" << std::endl;
    fs::path root = fs::temp_directory_path() / "ddloc_test_controller";
    fs::remove_all(root);
    fs::create_directories(root);

    testutil::SyntheticScene scene = testutil::makeScene(50, 16, 32);
    MemoryLoader loader = makeLoader(scene);

    ControllerOptions options;
    options.cache_dir = (root / "cache").string();
    options.output_path = (root / "results.txt").string();

    std::cout << "\n--- Test 1: batch run ---" << std::endl;
    {
        Controller controller;
        check(controller.run(loader, options) == 0, "run completes");
        check(!controller.codebookFromCache() && controller.codebookSize() == 50, "codebook built over every point");
        const auto &res = controller.results();
        check(res.size() == 3, "one result per query");
        check(res.size() == 3 && res[0].ok(), "good query localized");

        std::vector<std::string> lines = readLines(options.output_path);
        check(lines.size() == 3, "one result line per query");
        check(lines.size() == 3 && lines[0].rfind("good ", 0) == 0, "pose line starts with the image file name");
        check(lines.size() == 3 && lines[1] == "two FAILED insufficient_correspondences", "insufficient query reported");
        check(lines.size() == 3 && lines[2] == "blind FAILED localization_failed", "failed query reported");

        EvaluationSummary s = controller.summary();
        check(s.total == 3 && s.successes == 1 && s.insufficient == 1 && s.failed == 1, "evaluation counts");
        check(s.medianTranslation > 1e9, "median over three frames with two unlocalized is infinite");
        check(controller.perImageErrors().at("query/good").translation < 0.05, "good query within 5 cm");
    }

    std::cout << "\n--- Test 2: second run uses the cached codebook ---" << std::endl;
    {
        Controller controller;
        controller.run(loader, options);
        check(controller.codebookFromCache(), "codebook loaded from cache");
        check(controller.results().size() == 3 && controller.results()[0].ok(), "same outcome");

        ControllerOptions local = options;
        local.use_global = false;
        Controller plain;
        plain.run(loader, local);
        check(!plain.codebookFromCache(), "local-only run has its own cache entry");
        check(plain.results()[0].ok(), "local descriptors alone localize the good query");

        ControllerOptions tighter = options;
        tighter.max_pixel_distance = 3.0;
        Controller retuned;
        retuned.run(loader, tighter);
        check(!retuned.codebookFromCache(), "changed pixel threshold rebuilds the codebook");
        check(retuned.results().size() == 3 && retuned.results()[0].ok(), "rebuilt codebook still localizes");
    }

    std::cout << "\n--- Test 3: result line format ---" << std::endl;
    {
        LocalizationResult r;
        r.name = "img";
        r.status = LocalizationStatus::Success;
        r.R = cv::Mat::eye(3, 3, CV_64F);
        r.t = testutil::translation(1, 2, 3);
        check(Controller::formatResult(r) == "img 1 0 0 0 1 2 3", "identity pose");
        r.name = "seq1/frames/img.png";
        check(Controller::formatResult(r) == "img.png 1 0 0 0 1 2 3", "directory stripped from the name");
        r.R = testutil::rotation(0, 0, CV_PI / 2);
        std::string line = Controller::formatResult(r);
        std::istringstream ss(line);
        std::string name; double qw, qx, qy, qz;
        ss >> name >> qw >> qx >> qy >> qz;
        check(std::abs(qw - std::sqrt(0.5)) < 1e-9 && std::abs(qz - std::sqrt(0.5)) < 1e-9 && std::abs(qx) < 1e-9,
              "quaternion qw qx qy qz with qw >= 0");
    }

    std::cout << "\n--- Test 4: configuration errors stop the run ---" << std::endl;
    {
        ControllerOptions fresh = options;
        fresh.cache_dir = (root / "never").string();
        fresh.output_path = (root / "never" / "results.txt").string();

        MemoryLoader wrong = loader;
        wrong.query[0].desc = cv::Mat(wrong.query[0].desc.rows, 8, CV_32F, cv::Scalar(0));
        Controller c1;
        check(testutil::throws([&]{ c1.run(wrong, fresh); }), "local dimension mismatch rejected");
        check(!fs::exists(fresh.cache_dir), "no work done before the check");

        MemoryLoader shortGlobal = loader;
        for(auto &r: shortGlobal.train) r.globalDesc = r.globalDesc.colRange(0, 8).clone();
        for(auto &r: shortGlobal.query) r.globalDesc = r.globalDesc.colRange(0, 8).clone();
        Controller c2;
        check(testutil::throws([&]{ c2.run(shortGlobal, fresh); }), "global shorter than local rejected");

        ControllerOptions bad = options; bad.lambda = 1.2;
        Controller c3;
        check(testutil::throws([&]{ c3.run(loader, bad); }), "lambda outside [0,1] rejected");
    }

    std::cout << "\n--- Test 5: options file ---" << std::endl;
    {
        std::string path = (root / "options.yml").string();
        {
            cv::FileStorage out(path, cv::FileStorage::WRITE);
            out << "lambda" << 0.25 << "use_global" << 0 << "precision_bits" << 32
                << "reproj_threshold_px" << 8.0 << "cache_dir" << "somewhere" << "reduce_map" << 1;
        }
        ControllerOptions o = ControllerOptions::load(path);
        check(o.lambda == 0.25 && !o.use_global && o.precision_bits == 32, "values read");
        check(o.reproj_threshold_px == 8.0 && o.cache_dir == "somewhere" && o.reduce_map, "more values read");
        check(o.snap_query_global && o.min_inliers == 4 && o.reduce_min_neighbors == 16, "missing keys keep defaults");
        check(o.effectiveLambda() == 1.0, "no global fusion means lambda 1");

        {
            cv::FileStorage out(path, cv::FileStorage::WRITE);
            out << "precision_bits" << 16;
        }
        check(testutil::throws([&]{ ControllerOptions::load(path); }), "invalid precision rejected");
        check(testutil::throws([&]{ ControllerOptions::load((root / "missing.yml").string()); }), "missing file rejected");
    }

    std::cout << "\n--- Test 6: FileStorage manifest ---" << std::endl;
    {
        fs::path data = root / "dataset";
        fs::create_directories(data / "features");
        MemoryLoader src = makeLoader(scene);

        auto writeFeatures = [&](const ImageRecord &r, const std::string &file){
            cv::FileStorage out((data / file).string(), cv::FileStorage::WRITE);
            out << "keypoints" << cv::Mat(r.kps).reshape(1);
            out << "descriptors" << r.desc;
            out << "global_descriptor" << r.globalDesc;
        };
        auto writeImage = [&](cv::FileStorage &out, const ImageRecord &r, const std::string &file, bool withIds){
            cv::Quatd q = cv::Quatd::createFromRotMat(r.R_cw);
            out << "{" << "name" << r.name << "features" << file;
            out << "camera" << "{" << "model" << "PINHOLE" << "width" << 640 << "height" << 480
                << "params" << std::vector<double>{500.0, 500.0, 320.0, 240.0} << "}";
            out << "qvec" << std::vector<double>{q.w, q.x, q.y, q.z};
            out << "tvec" << std::vector<double>{r.t_cw.at<double>(0), r.t_cw.at<double>(1), r.t_cw.at<double>(2)};
            if(withIds){
                std::vector<int> ids;
                for(const auto &o: r.observations) ids.push_back(o.pointId);
                out << "point_ids" << ids;
            }
            out << "}";
        };

        std::string manifest = (data / "manifest.yml").string();
        {
            cv::FileStorage out(manifest, cv::FileStorage::WRITE);
            cv::Mat ids(static_cast<int>(scene.points.size()), 1, CV_32S), xyz(static_cast<int>(scene.points.size()), 3, CV_64F);
            for(int i=0;i<ids.rows;++i){
                ids.at<int>(i) = scene.points[i].id;
                xyz.at<double>(i,0) = scene.points[i].p.x;
                xyz.at<double>(i,1) = scene.points[i].p.y;
                xyz.at<double>(i,2) = scene.points[i].p.z;
            }
            out << "dataset_id" << "tiny" << "descriptor_model" << "synthetic";
            out << "points" << "{" << "ids" << ids << "xyz" << xyz << "}";
            out << "train" << "[";
            for(size_t k=0;k<src.train.size();++k){
                std::string file = "features/train" + std::to_string(k) + ".yml";
                writeFeatures(src.train[k], file);
                writeImage(out, src.train[k], file, true);
            }
            out << "]";
            out << "query" << "[";
            writeFeatures(src.query[0], "features/query0.yml");
            writeImage(out, src.query[0], "features/query0.yml", false);
            writeImage(out, src.query[0], "features/absent.yml", false);
            out << "]";
        }

        FileStorageDataLoader fsLoader(manifest);
        check(fsLoader.datasetId() == "tiny" && fsLoader.descriptorModelId() == "synthetic", "manifest header");
        std::vector<MapPoint> pts = fsLoader.mapPoints();
        check(pts.size() == scene.points.size() && pts[3].id == scene.points[3].id && pts[3].p == scene.points[3].p, "point table");
        std::vector<ImageRecord> train = fsLoader.listTrainingRecords();
        check(train.size() == 4 && train[1].observations.size() == 50 && !train[1].observations[0].hasPixel,
              "training images list visible point ids");
        check(train.size() == 4 && cv::norm(train[2].R_cw, src.train[2].R_cw, cv::NORM_INF) < 1e-12, "pose from quaternion");
        check(train.size() == 4 && cv::norm(train[2].desc, src.train[2].desc, cv::NORM_INF) == 0.0 &&
              train[2].kps == src.train[2].kps, "features read back");
        std::vector<ImageRecord> queries = fsLoader.listQueryRecords();
        check(queries.size() == 2 && queries[1].desc.empty() && queries[1].camera.valid(), "missing feature file gives empty descriptors");

        ControllerOptions o = options;
        o.cache_dir = (root / "fscache").string();
        o.output_path = (root / "fsresults.txt").string();
        Controller controller;
        check(controller.run(manifest, o) == 0, "run over the manifest");
        check(controller.results().size() == 2 && controller.results()[0].ok() && !controller.results()[1].ok(),
              "first query localized, second reported as failed");
        check(controller.summary().successes == 1, "first query within the success thresholds");

        check(testutil::throws([&]{ FileStorageDataLoader l((data / "nope.yml").string()); }), "missing manifest rejected");
    }

    std::cout << "\n--- Test 7: map reduction ---" << std::endl;
    {
        MemoryLoader withOutlier = loader;
        withOutlier.points.emplace_back(424242, cv::Point3d(500, 500, 500));
        ControllerOptions o = options;
        o.reduce_map = true;
        o.reduce_radius = 20.0;
        o.reduce_min_neighbors = 2;
        MapManager direct;
        direct.addMapPoints(withOutlier.points);
        check(direct.cullIsolatedPoints(o.reduce_radius, o.reduce_min_neighbors) == 1, "one isolated point");
        check(!direct.contains(424242) && direct.contains(scene.points[0].id) && direct.size() == 50, "lookup rebuilt");

        Controller controller;
        controller.run(withOutlier, o);
        check(controller.codebookSize() == 50, "isolated point removed, observed points kept");
        check(!controller.codebookFromCache(), "reduced map does not reuse the full-map codebook");
        check(fs::exists(fs::path(o.cache_dir) / "codebook-memory-reduced-synthetic-global-l0.500000-d5-r20n2-f64.yml.gz"),
              "reduced map cached under its own key");

        Controller again;
        again.run(withOutlier, o);
        check(again.codebookFromCache(), "same reduction settings hit the cache");

        ControllerOptions stronger = o;
        stronger.reduce_min_neighbors = 3;
        Controller rebuilt;
        rebuilt.run(withOutlier, stronger);
        check(!rebuilt.codebookFromCache(), "changed neighbour count rebuilds the codebook");
    }

    fs::remove_all(root);
    return testutil::finish("Controller");
}
