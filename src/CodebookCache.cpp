#include "CodebookCache.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ddloc {

namespace {

std::string sanitize(const std::string &s){
    std::string out = s.empty() ? std::string("none") : s;
    for(auto &ch: out){
        if(ch == '/' || ch == '\\' || ch == ' ' || ch == ':') ch = '_';
    }
    return out;
}

} // namespace

std::string CodebookKey::fileName() const {
    std::ostringstream ss;
    ss << "codebook-" << sanitize(mapId) << "-" << sanitize(descriptorModelId)
       << (useGlobal ? "-global-l" + std::to_string(lambda) : std::string("-local"))
       << "-d" << maxPixelDistance;
    if(reduceRadius > 0.0) ss << "-r" << reduceRadius << "n" << reduceMinNeighbors;
    ss << "-f" << precisionBits << ".yml.gz";
    return ss.str();
}

bool CodebookKey::operator==(const CodebookKey &o) const {
    return mapId == o.mapId && descriptorModelId == o.descriptorModelId && lambda == o.lambda &&
           useGlobal == o.useGlobal && precisionBits == o.precisionBits &&
           maxPixelDistance == o.maxPixelDistance && reduceRadius == o.reduceRadius &&
           reduceMinNeighbors == o.reduceMinNeighbors;
}

CodebookCache::CodebookCache(std::string directory)
    : dir_(std::move(directory))
{
}

std::string CodebookCache::pathFor(const CodebookKey &key) const {
    return (std::filesystem::path(dir_) / key.fileName()).string();
}

void CodebookCache::write(const std::string &path, const CodebookKey &key, const Codebook &codebook){
    if(codebook.empty()) throw std::runtime_error("CodebookCache: refusing to persist an empty codebook");
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if(!fs.isOpened()) throw std::runtime_error("CodebookCache: cannot open " + path + " for writing");

    fs << "precision" << codebook.precisionBits();
    fs << "dim" << codebook.dim();
    fs << "size" << codebook.size();
    fs << "map_id" << key.mapId;
    fs << "descriptor_model" << key.descriptorModelId;
    fs << "lambda" << key.lambda;
    fs << "use_global" << static_cast<int>(key.useGlobal);
    fs << "max_pixel_distance" << key.maxPixelDistance;
    fs << "reduce_radius" << key.reduceRadius;
    fs << "reduce_min_neighbors" << key.reduceMinNeighbors;
    fs << "point_ids" << cv::Mat(codebook.pointIds(), true);
    fs << "counts" << cv::Mat(codebook.counts(), true);
    fs << "descriptors" << codebook.descriptors();
    fs.release();
}

Codebook CodebookCache::read(const std::string &path, CodebookKey &storedKey){
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if(!fs.isOpened()) throw std::runtime_error("CodebookCache: cannot open " + path);

    int precision = 0, dim = 0, size = 0, useGlobal = 1;
    fs["precision"] >> precision;
    fs["dim"] >> dim;
    fs["size"] >> size;
    fs["map_id"] >> storedKey.mapId;
    fs["descriptor_model"] >> storedKey.descriptorModelId;
    fs["lambda"] >> storedKey.lambda;
    fs["use_global"] >> useGlobal;
    storedKey.useGlobal = useGlobal != 0;
    // absent in files written before these fields existed: reads as 0, which makes them stale
    fs["max_pixel_distance"] >> storedKey.maxPixelDistance;
    fs["reduce_radius"] >> storedKey.reduceRadius;
    fs["reduce_min_neighbors"] >> storedKey.reduceMinNeighbors;
    storedKey.precisionBits = precision;

    cv::Mat ids, counts, desc;
    fs["point_ids"] >> ids;
    fs["counts"] >> counts;
    fs["descriptors"] >> desc;
    fs.release();

    if(precision != 32 && precision != 64) throw std::runtime_error("CodebookCache: " + path + " has no valid precision field");
    const int expectedDepth = precision == 32 ? CV_32F : CV_64F;
    if(desc.empty() || desc.depth() != expectedDepth || desc.rows != size || desc.cols != dim)
        throw std::runtime_error("CodebookCache: " + path + " descriptor block does not match its header");
    if(ids.total() != static_cast<size_t>(size) || counts.total() != static_cast<size_t>(size) ||
       ids.type() != CV_32S || counts.type() != CV_32S)
        throw std::runtime_error("CodebookCache: " + path + " id/count blocks do not match its header");

    std::vector<PointId> idVec(ids.begin<int>(), ids.end<int>());
    std::vector<int> countVec(counts.begin<int>(), counts.end<int>());
    return Codebook(std::move(idVec), desc, std::move(countVec));
}

bool CodebookCache::load(const CodebookKey &key, int expectedDim, Codebook &out) const {
    std::string path = pathFor(key);
    if(!std::filesystem::exists(path)) return false;

    CodebookKey stored;
    Codebook cb = read(path, stored);
    if(stored.precisionBits != key.precisionBits)
        throw std::runtime_error("CodebookCache: " + path + " stores " + std::to_string(stored.precisionBits) +
                                 "-bit descriptors but " + std::to_string(key.precisionBits) + "-bit were requested");
    if(!(stored == key)){
        std::cout << "CodebookCache: stale codebook at " << path << ", rebuilding" << std::endl;
        return false;
    }
    if(expectedDim > 0 && cb.dim() != expectedDim)
        throw std::invalid_argument("CodebookCache: " + path + " has descriptor dimension " + std::to_string(cb.dim()) +
                                    ", configured dimension is " + std::to_string(expectedDim));
    out = std::move(cb);
    return true;
}

std::string CodebookCache::save(const CodebookKey &key, const Codebook &codebook) const {
    if(codebook.precisionBits() != key.precisionBits)
        throw std::invalid_argument("CodebookCache: codebook precision does not match its key");
    std::filesystem::create_directories(dir_);
    std::string path = pathFor(key);
    write(path, key, codebook);
    return path;
}

} // namespace ddloc
