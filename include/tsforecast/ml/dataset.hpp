#pragma once
#include "tsforecast/ml/transforms/fillna.hpp"
#include <torch/torch.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tsforecast {
namespace ml {

struct RowKey {
  std::string datetime;
  std::string instrument;
};

inline bool operator==(const RowKey& a, const RowKey& b) {
  return a.datetime == b.datetime && a.instrument == b.instrument;
}
inline bool operator<(const RowKey& a, const RowKey& b) {
  return a.datetime != b.datetime ? a.datetime < b.datetime : a.instrument < b.instrument;
}

using Index = std::vector<RowKey>;

// Named partition ("train"/"valid"/"test"/...) or an inclusive datetime range.
struct Segment {
  std::string name;
  std::string start;
  std::string end;

  Segment(const char* n) : name(n) {}
  Segment(std::string n) : name(std::move(n)) {}
  static Segment range(std::string start, std::string end) {
    Segment s("");
    s.start = std::move(start);
    s.end = std::move(end);
    return s;
  }
  bool is_range() const { return name.empty(); }
  std::string describe() const { return is_range() ? "[" + start + ", " + end + "]" : name; }
};

// Raw aligned table: one row per (datetime, instrument).
struct Panel {
  Index index;
  std::vector<std::string> feature_names;
  torch::Tensor feature;   // [N, F] float32
  torch::Tensor label;     // [N] float32, NaN where unknown

  int64_t rows() const { return static_cast<int64_t>(index.size()); }
  int64_t num_features() const { return feature.defined() ? feature.size(1) : 0; }
};

// csv header: datetime,instrument,<features...>,<label_column>
Panel load_panel_csv(const std::string& path, const std::string& label_column = "label");

struct Frame {
  Index index;
  torch::Tensor feature;   // [N, F]
  torch::Tensor label;     // [N], undefined for ColSet::Feature

  int64_t size() const { return static_cast<int64_t>(index.size()); }
  bool empty() const { return index.empty(); }
  Frame take(const torch::Tensor& rows) const;
  // drops rows with NaN in any feature or in the label
  Frame dropna() const;
};

struct Series {
  Index index;
  torch::Tensor values;    // [N] float32, cpu

  int64_t size() const { return static_cast<int64_t>(index.size()); }
};

enum class ColSet { Feature, FeatureLabel };
enum class DataKey { Infer, Learn };   // Learn drops rows whose label is NaN

// Window view over a prepared segment: sample i is [step_len, F+1], label last.
class TSDataSampler {
public:
  TSDataSampler() = default;
  // data [R, C]; windows [N, T] row ids into data, -1 pads
  TSDataSampler(torch::Tensor data, torch::Tensor windows, Index index);

  void config(FillnaType fillna_type) { fillna_ = fillna_type; }
  FillnaType fillna_type() const { return fillna_; }

  int64_t size() const { return index_ ? static_cast<int64_t>(index_->size()) : 0; }
  bool empty() const { return size() == 0; }
  int64_t step_len() const { return windows_.defined() ? windows_.size(1) : 0; }
  int64_t channels() const { return data_.defined() ? data_.size(1) : 0; }

  torch::Tensor get(int64_t i) const;
  const Index& get_index() const;

private:
  torch::Tensor data_;      // [R+1, C], last row is the NaN pad
  torch::Tensor windows_;   // [N, T]
  std::shared_ptr<const Index> index_;   // shared by copies, batching never reads it
  FillnaType fillna_{FillnaType::None};
};

class DatasetH {
public:
  using SegmentMap = std::map<std::string, std::pair<std::string, std::string>>;

  DatasetH(Panel panel, SegmentMap segments);
  virtual ~DatasetH() = default;

  const SegmentMap& segments() const { return segments_; }
  bool has_segment(const std::string& name) const { return segments_.count(name) > 0; }
  const Panel& panel() const { return panel_; }

  Frame prepare(const Segment& segment,
                ColSet col_set = ColSet::FeatureLabel,
                DataKey data_key = DataKey::Infer) const;

protected:
  // positions into panel_, ascending (datetime, instrument)
  std::vector<int64_t> select_rows(const Segment& segment) const;
  bool keep_row(int64_t row, DataKey data_key) const;

  Panel panel_;
  SegmentMap segments_;
};

class TSDatasetH : public DatasetH {
public:
  TSDatasetH(Panel panel, SegmentMap segments, int64_t step_len);

  int64_t step_len() const { return step_len_; }
  TSDataSampler prepare_ts(const Segment& segment, DataKey data_key = DataKey::Infer) const;

private:
  int64_t step_len_;
};

} // namespace ml
} // namespace tsforecast
