#pragma once

#include "../CutTypes.h"
#include "Features.h"

#include <sqlite3.h>

#include <string>

namespace cutgraph {
namespace features {

/**
 * FeatureStore: SQLite file holding feature matrices as float BLOBs, plus an
 * optional index of Features references pointing into it.
 */
class FeatureStore {
  public:
    enum class Mode {
        ReadWrite,
        ReadOnly
    };

    explicit FeatureStore(const std::string& path, Mode mode = Mode::ReadWrite);
    ~FeatureStore();

    FeatureStore(const FeatureStore&) = delete;
    FeatureStore& operator=(const FeatureStore&) = delete;

    void initialize();

    void write_matrix(const std::string& key, const FeatureMatrix& matrix);
    FeatureMatrix read_matrix(const std::string& key) const;
    bool contains(const std::string& key) const;

    // Replaces the stored index with the given set.
    void save_feature_set(const FeatureSet& featureSet);
    FeatureSet load_feature_set() const;

  private:
    std::string path_;
    sqlite3* db_{nullptr};
};

}  // namespace features
}  // namespace cutgraph
