#pragma once
#include "Codebook.hpp"
#include <string>

namespace ddloc {

// Everything a codebook depends on. Changing any field invalidates a persisted codebook.
struct CodebookKey {
    std::string mapId;
    std::string descriptorModelId;
    double lambda = 0.5;
    bool useGlobal = true;
    int precisionBits = 64;
    double maxPixelDistance = 5.0; // keypoint assignment threshold
    double reduceRadius = 0.0;     // map reduction, 0 when the full map is used
    int reduceMinNeighbors = 0;

    // e.g. codebook-<map>-<model>-global-l0.500000-d5-f64.yml.gz, with -r<radius>n<neighbors>
    // before the precision when the map is reduced
    std::string fileName() const;
    bool operator==(const CodebookKey &o) const;
};

// Persisted codebooks in a directory, one FileStorage file per key.
class CodebookCache {
public:
    explicit CodebookCache(std::string directory);

    // Returns false when no file exists for the key or the stored key fields differ (stale).
    // Throws std::runtime_error on a corrupted file or a precision that contradicts the key,
    // std::invalid_argument when the stored dimension differs from expectedDim (> 0).
    bool load(const CodebookKey &key, int expectedDim, Codebook &out) const;
    // Returns the written path. Throws std::runtime_error if the file cannot be written.
    std::string save(const CodebookKey &key, const Codebook &codebook) const;

    std::string pathFor(const CodebookKey &key) const;

    // Single-file helpers used by load/save.
    static void write(const std::string &path, const CodebookKey &key, const Codebook &codebook);
    static Codebook read(const std::string &path, CodebookKey &storedKey);

private:
    std::string dir_;
};

} // namespace ddloc
