#include <f1ml/model.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace f1ml {

static void check_input_(const std::vector<double>& x, std::size_t expected) {
  if (x.size() != expected) {
    throw std::invalid_argument("model expects " + std::to_string(expected) +
                                " features, got " + std::to_string(x.size()));
  }
}

double apply_link(Link link, double score) {
  switch (link) {
    case Link::Logistic:
      // Split by sign so exp() never overflows.
      if (score >= 0.0) return 1.0 / (1.0 + std::exp(-score));
      return std::exp(score) / (1.0 + std::exp(score));
    case Link::Identity:
    default:
      return score;
  }
}

LinearModel::LinearModel(std::vector<double> coefficients, double intercept, Link link)
  : coef_(std::move(coefficients)), intercept_(intercept), link_(link) {}

double LinearModel::predict(const std::vector<double>& x) const {
  check_input_(x, coef_.size());
  double s = intercept_;
  for (std::size_t i = 0; i < coef_.size(); ++i) s += coef_[i] * x[i];
  return apply_link(link_, s);
}

DecisionTree::DecisionTree(std::vector<TreeNode> nodes, std::size_t input_size)
  : nodes_(std::move(nodes)) {
  if (nodes_.empty()) throw std::invalid_argument("decision tree has no nodes");
  const int n = static_cast<int>(nodes_.size());
  for (int i = 0; i < n; ++i) {
    const auto& nd = nodes_[static_cast<std::size_t>(i)];
    if (nd.is_leaf()) continue;
    if (static_cast<std::size_t>(nd.feature) >= input_size) {
      throw std::invalid_argument("tree node " + std::to_string(i) + " splits on unknown feature " +
                                  std::to_string(nd.feature));
    }
    if (nd.left <= i || nd.left >= n || nd.right <= i || nd.right >= n) {
      throw std::invalid_argument("tree node " + std::to_string(i) + " has invalid children");
    }
  }
}

double DecisionTree::evaluate(const std::vector<double>& x) const {
  std::size_t i = 0;
  while (!nodes_[i].is_leaf()) {
    const auto& nd = nodes_[i];
    i = static_cast<std::size_t>(x[static_cast<std::size_t>(nd.feature)] <= nd.threshold ? nd.left : nd.right);
  }
  return nodes_[i].value;
}

TreeEnsembleModel::TreeEnsembleModel(std::vector<DecisionTree> trees,
                                     std::size_t input_size,
                                     Aggregation aggregation,
                                     double base_score,
                                     Link link)
  : trees_(std::move(trees)), input_size_(input_size), aggregation_(aggregation),
    base_score_(base_score), link_(link) {
  if (trees_.empty()) throw std::invalid_argument("tree ensemble has no trees");
}

double TreeEnsembleModel::predict(const std::vector<double>& x) const {
  check_input_(x, input_size_);
  double sum = 0.0;
  for (const auto& t : trees_) sum += t.evaluate(x);
  const double score = (aggregation_ == Aggregation::Mean)
                         ? base_score_ + sum / static_cast<double>(trees_.size())
                         : base_score_ + sum;
  return apply_link(link_, score);
}

} // namespace f1ml
