#include "python_ast.h"
#include <deque>

namespace calcrun {

void walk(const Node& root, const std::function<bool(const Node&)>& visitor) {
    std::deque<const Node*> todo;
    todo.push_back(&root);
    while (!todo.empty()) {
        const Node* node = todo.front();
        todo.pop_front();
        for (const auto& child : node->children) {
            todo.push_back(child.get());
        }
        if (!visitor(*node)) return;
    }
}

size_t count_nodes(const Node& root) {
    size_t count = 0;
    walk(root, [&count](const Node&) {
        ++count;
        return true;
    });
    return count;
}

} // namespace calcrun
