#include <algorithm>
#include <vector>

#include "../eval_session.h"

namespace arbor {

std::vector<bool> compute_frame_dependence(const Tree& tree, NodeId lambda, const std::vector<NodeId>& positional) {
  std::vector<bool> dependent(tree.size(), false);
  const auto& params = tree.node(lambda).as<LambdaNode>().params;

  // Children always precede their parents in the arena, so one forward pass
  // sees every child before the nodes that use it.
  for (const auto& node : tree.nodes()) {
    switch (node.kind()) {
      case NodeKind::Value: {
        const auto& name = node.as<ValueNode>().name;
        dependent[node.id] = std::find(params.begin(), params.end(), name) != params.end() ||
                             std::find(positional.begin(), positional.end(), node.id) != positional.end();
        break;
      }
      case NodeKind::Lambda:
        break;
      default:
        for (const auto child : tree.children(node.id)) {
          if (dependent[child]) {
            dependent[node.id] = true;
            break;
          }
        }
        break;
    }
  }
  return dependent;
}

}  // namespace arbor
