//
// Created by igor on 03/12/2025.
//

#include <msgdef/transform.hh>
#include <msgdef/parser_error.hh>

#include <algorithm>
#include <set>

namespace msgdef::transform {
    namespace {
        class topo_sorter {
            public:
                explicit topo_sorter(const import_graph& graph)
                    : graph_(graph) {
                }

                std::vector<std::string> run() {
                    for (const auto& [file, _] : graph_) {
                        visit(file);
                    }
                    return std::move(order_);
                }

            private:
                void visit(const std::string& file) {
                    if (done_.contains(file)) {
                        return;
                    }
                    if (on_stack_.contains(file)) {
                        throw circular_import_error(cycle_from(file));
                    }

                    on_stack_.insert(file);
                    stack_.push_back(file);

                    if (auto it = graph_.find(file); it != graph_.end()) {
                        for (const auto& dep : it->second) {
                            visit(dep);
                        }
                    }

                    stack_.pop_back();
                    on_stack_.erase(file);
                    done_.insert(file);
                    order_.push_back(file);
                }

                // Stack slice from the re-entered file, closed by the file itself
                std::vector<std::string> cycle_from(const std::string& file) const {
                    auto it = std::find(stack_.begin(), stack_.end(), file);
                    std::vector<std::string> cycle(it, stack_.end());
                    cycle.push_back(file);
                    return cycle;
                }

                const import_graph& graph_;
                std::set<std::string> done_;
                std::set<std::string> on_stack_;
                std::vector<std::string> stack_;
                std::vector<std::string> order_;
        };
    }

    std::vector<std::string> dependency_sort(const import_graph& graph) {
        topo_sorter sorter(graph);
        return sorter.run();
    }

    std::vector<std::string> dependency_sort(const model_registry& registry) {
        import_graph graph;
        for (const auto& [path, model] : registry) {
            auto& deps = graph[path];
            for (const auto& imp : model->imports) {
                deps.push_back(imp.resolved_path.empty() ? imp.path : imp.resolved_path);
            }
        }
        return dependency_sort(graph);
    }
}
