#pragma once
#include "ImageRecord.hpp"
#include "MapPoint.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ddloc {

// Source of the reconstruction and of per-image features. One adapter per dataset format.
class DataLoader {
public:
    virtual ~DataLoader() = default;

    // Identifies the map for codebook caching.
    virtual std::string datasetId() const = 0;
    // Identifies the local/global descriptor models for codebook caching.
    virtual std::string descriptorModelId() const = 0;

    virtual std::vector<MapPoint> mapPoints() const = 0;
    virtual std::vector<ImageRecord> listTrainingRecords() const = 0;
    virtual std::vector<ImageRecord> listQueryRecords() const = 0;
};

// Reads a cv::FileStorage manifest (YAML/XML, optionally .gz):
//
//   dataset_id: "scene"
//   descriptor_model: "r2d2-netvlad"
//   points: { ids: <N x 1 int matrix>, xyz: <N x 3 double matrix> }
//   train:
//     - { name: "db/0001.jpg", features: "features/0001.yml",
//         camera: { model: "PINHOLE", width: 640, height: 480, params: [fx, fy, cx, cy] },
//         qvec: [qw, qx, qy, qz], tvec: [tx, ty, tz],        # world-to-camera
//         point_ids: [...], uvs: <M x 2 float matrix, optional> }
//   query:
//     - { name: ..., features: ..., camera: ..., qvec/tvec optional }
//
// A feature file holds "keypoints" (N x 2), "descriptors" (N x Dl) and optionally
// "global_descriptor" (1 x Dg). Relative paths are resolved against the manifest directory.
class FileStorageDataLoader : public DataLoader {
public:
    // Throws std::runtime_error if the manifest cannot be opened or has no point table.
    explicit FileStorageDataLoader(const std::string &manifestPath);

    std::string datasetId() const override { return datasetId_; }
    std::string descriptorModelId() const override { return descriptorModelId_; }
    std::vector<MapPoint> mapPoints() const override;
    std::vector<ImageRecord> listTrainingRecords() const override;
    std::vector<ImageRecord> listQueryRecords() const override;

    // Reads keypoints and descriptors into record. Returns false (record untouched) if the
    // file is missing or unreadable.
    static bool loadFeatures(const std::string &path, ImageRecord &record);

private:
    std::vector<ImageRecord> readRecords(const std::string &section) const;

    std::string manifestPath_;
    std::string baseDir_;
    std::string datasetId_;
    std::string descriptorModelId_;
};

} // namespace ddloc
