#include "tsforecast/ml/dataset.hpp"
#include "tsforecast/log.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace tsforecast {
namespace ml {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string cell;
  std::istringstream iss(line);
  while (std::getline(iss, cell, ',')) {
    if (!cell.empty() && cell.back() == '\r') cell.pop_back();
    out.push_back(cell);
  }
  if (!line.empty() && line.back() == ',') out.emplace_back();
  return out;
}

float parse_cell(const std::string& cell, size_t line_no) {
  if (cell.empty() || cell == "nan" || cell == "NaN" || cell == "NA") {
    return std::numeric_limits<float>::quiet_NaN();
  }
  char* end = nullptr;
  const double v = std::strtod(cell.c_str(), &end);
  if (end == cell.c_str() || *end != '\0') {
    throw std::runtime_error("bad numeric value '" + cell + "' at line " + std::to_string(line_no));
  }
  return static_cast<float>(v);
}

torch::Tensor to_index_tensor(const std::vector<int64_t>& rows) {
  return torch::tensor(rows, torch::kInt64);
}

} // namespace

Panel load_panel_csv(const std::string& path, const std::string& label_column) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("cannot open dataset csv: " + path);

  std::string line;
  if (!std::getline(ifs, line)) throw std::runtime_error("empty dataset csv: " + path);
  const auto header = split_csv_line(line);
  if (header.size() < 3 || header[0] != "datetime" || header[1] != "instrument") {
    throw std::runtime_error("csv header must start with datetime,instrument: " + path);
  }
  auto label_it = std::find(header.begin(), header.end(), label_column);
  if (label_it == header.end()) {
    throw std::runtime_error("label column '" + label_column + "' not found in " + path);
  }
  const size_t label_col = static_cast<size_t>(label_it - header.begin());

  Panel panel;
  for (size_t c = 2; c < header.size(); ++c) {
    if (c != label_col) panel.feature_names.push_back(header[c]);
  }
  const int64_t F = static_cast<int64_t>(panel.feature_names.size());

  std::vector<float> feats;
  std::vector<float> labels;
  size_t line_no = 1;
  while (std::getline(ifs, line)) {
    ++line_no;
    if (line.empty() || line == "\r") continue;
    const auto cells = split_csv_line(line);
    if (cells.size() != header.size()) {
      throw std::runtime_error("expected " + std::to_string(header.size()) + " columns at line " +
                               std::to_string(line_no) + " of " + path);
    }
    panel.index.push_back({cells[0], cells[1]});
    for (size_t c = 2; c < cells.size(); ++c) {
      if (c == label_col) labels.push_back(parse_cell(cells[c], line_no));
      else feats.push_back(parse_cell(cells[c], line_no));
    }
  }

  const int64_t N = panel.rows();
  panel.feature = torch::from_blob(feats.data(), {N, F}, torch::kFloat32).clone();
  panel.label = torch::from_blob(labels.data(), {N}, torch::kFloat32).clone();
  TSFLOG_I("loaded panel %s: %lld rows, %lld features", path.c_str(), (long long)N, (long long)F);
  return panel;
}

Frame Frame::take(const torch::Tensor& rows) const {
  Frame out;
  auto acc = rows.accessor<int64_t, 1>();
  out.index.reserve(rows.size(0));
  for (int64_t i = 0; i < rows.size(0); ++i) out.index.push_back(index[acc[i]]);
  out.feature = feature.index_select(0, rows);
  if (label.defined()) out.label = label.index_select(0, rows);
  return out;
}

Frame Frame::dropna() const {
  if (empty()) return *this;
  auto bad = torch::isnan(feature).any(1);
  if (label.defined()) bad = bad.logical_or(torch::isnan(label));
  auto rows = torch::nonzero(bad.logical_not()).squeeze(1).to(torch::kInt64).contiguous();
  return take(rows);
}

TSDataSampler::TSDataSampler(torch::Tensor data, torch::Tensor windows, Index index)
    : windows_(std::move(windows)), index_(std::make_shared<const Index>(std::move(index))) {
  auto pad = torch::full({1, data.size(1)}, std::numeric_limits<float>::quiet_NaN(), data.options());
  data_ = torch::cat({data, pad}, 0);
  // -1 pads point at the trailing NaN row
  windows_ = torch::where(windows_ < 0, torch::full_like(windows_, data.size(0)), windows_);
}

const Index& TSDataSampler::get_index() const {
  static const Index kEmpty;
  return index_ ? *index_ : kEmpty;
}

torch::Tensor TSDataSampler::get(int64_t i) const {
  if (i < 0 || i >= size()) throw std::out_of_range("TSDataSampler index " + std::to_string(i));
  auto window = data_.index_select(0, windows_[i]);
  return transforms::fill_along_time(window, fillna_);
}

DatasetH::DatasetH(Panel panel, SegmentMap segments) : segments_(std::move(segments)) {
  if (!panel.feature.defined() || !panel.label.defined()) {
    throw std::invalid_argument("panel requires feature and label tensors");
  }
  if (panel.feature.size(0) != panel.rows() || panel.label.size(0) != panel.rows()) {
    throw std::invalid_argument("panel index, feature and label lengths differ");
  }
  std::vector<int64_t> order(panel.rows());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&panel](int64_t a, int64_t b) { return panel.index[a] < panel.index[b]; });
  auto rows = to_index_tensor(order);

  panel_.feature_names = std::move(panel.feature_names);
  panel_.feature = panel.feature.to(torch::kFloat32).index_select(0, rows).contiguous();
  panel_.label = panel.label.to(torch::kFloat32).index_select(0, rows).contiguous();
  panel_.index.reserve(order.size());
  for (auto r : order) panel_.index.push_back(std::move(panel.index[r]));
}

bool DatasetH::keep_row(int64_t row, DataKey data_key) const {
  if (data_key == DataKey::Infer) return true;
  return !std::isnan(panel_.label.data_ptr<float>()[row]);
}

std::vector<int64_t> DatasetH::select_rows(const Segment& segment) const {
  std::string start = segment.start, end = segment.end;
  if (!segment.is_range()) {
    auto it = segments_.find(segment.name);
    if (it == segments_.end()) throw std::invalid_argument("unknown segment `" + segment.name + "`");
    start = it->second.first;
    end = it->second.second;
  }
  std::vector<int64_t> rows;
  for (int64_t r = 0; r < panel_.rows(); ++r) {
    const auto& dt = panel_.index[r].datetime;
    if (dt >= start && dt <= end) rows.push_back(r);
  }
  return rows;
}

Frame DatasetH::prepare(const Segment& segment, ColSet col_set, DataKey data_key) const {
  std::vector<int64_t> rows;
  for (auto r : select_rows(segment)) {
    if (keep_row(r, data_key)) rows.push_back(r);
  }

  Frame frame;
  frame.index.reserve(rows.size());
  for (auto r : rows) frame.index.push_back(panel_.index[r]);
  auto idx = to_index_tensor(rows);
  frame.feature = panel_.feature.index_select(0, idx);
  if (col_set == ColSet::FeatureLabel) frame.label = panel_.label.index_select(0, idx);
  return frame;
}

TSDatasetH::TSDatasetH(Panel panel, SegmentMap segments, int64_t step_len)
    : DatasetH(std::move(panel), std::move(segments)), step_len_(step_len) {
  if (step_len_ <= 0) throw std::invalid_argument("step_len must be positive");
}

TSDataSampler TSDatasetH::prepare_ts(const Segment& segment, DataKey data_key) const {
  // history of a sample may reach back before the segment start
  std::unordered_map<std::string, std::vector<int64_t>> history;
  std::vector<int64_t> pos_in_inst(panel_.rows(), -1);
  for (int64_t r = 0; r < panel_.rows(); ++r) {
    if (!keep_row(r, data_key)) continue;
    auto& h = history[panel_.index[r].instrument];
    pos_in_inst[r] = static_cast<int64_t>(h.size());
    h.push_back(r);
  }

  Index index;
  std::vector<int64_t> windows;
  for (auto r : select_rows(segment)) {
    if (pos_in_inst[r] < 0) continue;
    const auto& h = history[panel_.index[r].instrument];
    const int64_t last = pos_in_inst[r];
    for (int64_t t = last - step_len_ + 1; t <= last; ++t) {
      windows.push_back(t >= 0 ? h[t] : -1);
    }
    index.push_back(panel_.index[r]);
  }

  const int64_t N = static_cast<int64_t>(index.size());
  auto data = torch::cat({panel_.feature, panel_.label.unsqueeze(1)}, 1);
  auto win = torch::tensor(windows, torch::kInt64).reshape({N, step_len_});
  return TSDataSampler(std::move(data), std::move(win), std::move(index));
}

} // namespace ml
} // namespace tsforecast
