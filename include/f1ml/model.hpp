#pragma once
#include <cstddef>
#include <vector>

namespace f1ml {

enum class ModelKind : int {
  Classifier = 0,
  Regressor = 1
};

// Output link applied to the raw score.
enum class Link : int {
  Identity = 0,
  Logistic = 1
};

// Read-only inference over one aligned feature vector. Implementations are
// immutable after construction and safe to share across threads.
class Model {
public:
  virtual ~Model() = default;
  // Classifiers return the positive-class probability, regressors the value.
  // Throws std::invalid_argument when x.size() != input_size().
  virtual double predict(const std::vector<double>& x) const = 0;
  virtual std::size_t input_size() const = 0;
};

double apply_link(Link link, double score);

// intercept + sum(coef[i] * x[i]), through the link.
class LinearModel final : public Model {
public:
  LinearModel(std::vector<double> coefficients, double intercept, Link link = Link::Identity);

  double predict(const std::vector<double>& x) const override;
  std::size_t input_size() const override { return coef_.size(); }

  const std::vector<double>& coefficients() const { return coef_; }
  double intercept() const { return intercept_; }

private:
  std::vector<double> coef_;
  double intercept_;
  Link link_;
};

// Node of a binary tree; leaf when feature < 0.
// Internal nodes go left when x[feature] <= threshold.
struct TreeNode {
  int feature = -1;
  double threshold = 0.0;
  int left = -1;
  int right = -1;
  double value = 0.0;
  bool is_leaf() const { return feature < 0; }
};

// nodes[0] is the root. Children must come after their parent, which keeps
// evaluation finite. Throws std::invalid_argument on a malformed tree.
class DecisionTree {
public:
  DecisionTree(std::vector<TreeNode> nodes, std::size_t input_size);
  double evaluate(const std::vector<double>& x) const;
  std::size_t node_count() const { return nodes_.size(); }

private:
  std::vector<TreeNode> nodes_;
};

// Mean: averaged forest (e.g., leaf class probabilities).
// Sum: boosted trees, base_score + sum of leaves.
enum class Aggregation : int {
  Mean = 0,
  Sum = 1
};

class TreeEnsembleModel final : public Model {
public:
  TreeEnsembleModel(std::vector<DecisionTree> trees,
                    std::size_t input_size,
                    Aggregation aggregation,
                    double base_score = 0.0,
                    Link link = Link::Identity);

  double predict(const std::vector<double>& x) const override;
  std::size_t input_size() const override { return input_size_; }
  std::size_t tree_count() const { return trees_.size(); }

private:
  std::vector<DecisionTree> trees_;
  std::size_t input_size_;
  Aggregation aggregation_;
  double base_score_;
  Link link_;
};

} // namespace f1ml
